#include <restinio/all.hpp>

#include <spdlog/spdlog.h>

#include "application.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "multithreading.hpp"
#include "request_processor.hpp"

namespace items_service
{

// Short alias for express-like router.
using router_t = restinio::router::express_router_t<>;

auto make_router(
	worker_pool_t & pool,
	request_processor_t & processor)
{
	auto router = std::make_unique<router_t>();

	// Every handler just delegates the actual work to `processor`
	// on one of worker threads. A request that arrives while the pool
	// is being stopped is rejected so RESTinio can answer it itself.
	const auto delegate = [&pool](const auto & req, auto action) {
		if(!pool.submit(
				task_t{
					[req, action] { action(req); }
				}))
			return restinio::request_rejected();
		return restinio::request_accepted();
	};

	router->http_get("/",
			[delegate, &processor](const auto & req, const auto &) {
				return delegate(req, [&processor](const auto & r) {
						processor.on_home_page(r);
					});
			});

	router->http_get("/items",
			[delegate, &processor](const auto & req, const auto &) {
				return delegate(req, [&processor](const auto & r) {
						processor.on_items_page(r);
					});
			});

	router->http_get("/create",
			[delegate, &processor](const auto & req, const auto &) {
				return delegate(req, [&processor](const auto & r) {
						processor.on_create_form(r);
					});
			});

	router->http_get("/api/v1/items",
			[delegate, &processor](const auto & req, const auto &) {
				return delegate(req, [&processor](const auto & r) {
						processor.on_get_all_items(r);
					});
			});

	router->http_post("/api/v1/items",
			[delegate, &processor](const auto & req, const auto &) {
				return delegate(req, [&processor](const auto & r) {
						processor.on_create_new_item(r);
					});
			});

	// Any text is accepted as ID, it's checked by the processor.
	router->http_get("/api/v1/items/:id",
			[delegate, &processor](const auto & req, const auto & params) {
				const auto raw_id = params["id"];
				std::string id{ raw_id.data(), raw_id.size() };
				return delegate(req, [&processor, id](const auto & r) {
						processor.on_get_specific_item(r, id);
					});
			});

	router->http_delete("/api/v1/items/:id",
			[delegate, &processor](const auto & req, const auto & params) {
				const auto raw_id = params["id"];
				std::string id{ raw_id.data(), raw_id.size() };
				return delegate(req, [&processor, id](const auto & r) {
						processor.on_delete_specific_item(r, id);
					});
			});

	router->non_matched_request_handler(
			[](const auto & req) {
				return req->create_response(restinio::status_not_found())
					.append_header_date_field()
					.connection_close()
					.done();
			});

	return router;
}

} /* namespace items_service */

void run_application(const items_service::config_t & config)
{
	using namespace items_service;

	item_store_t store;
	request_processor_t processor{ store };

	worker_pool_t worker_threads_pool{ config.m_worker_threads };

	// Default traits are used as a base because they are thread-safe.
	struct my_traits_t : public restinio::default_traits_t
	{
		using logger_t = spdlog_logger_t;
		using request_handler_t = router_t;
	};

	spdlog::info("starting server on {}:{} with {} worker thread(s)",
			config.m_address, config.m_port, worker_threads_pool.size());

	restinio::run(
		restinio::on_this_thread<my_traits_t>()
			.port(config.m_port)
			.address(config.m_address)
			.request_handler(make_router(worker_threads_pool, processor))
			.cleanup_func([&worker_threads_pool] {
				worker_threads_pool.stop();
			}));

	spdlog::info("server stopped");
}

int main()
{
	return items_service::run_guarded([] {
			const auto config = items_service::load_config_from_environment();
			spdlog::set_level(config.m_log_level);

			run_application(config);
		});
}
