#include "request_processor.hpp"

#include "html_pages.hpp"
#include "input_validator.hpp"
#include "negotiation.hpp"
#include "payload_binding.hpp"
#include "response_renderers.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <stdexcept>

namespace items_service
{

// A type of exception to be thrown in the case of some failure
// during processing of a request.
//
// NOTE: this error is related to some business-logic problem.
class request_processing_failure_t : public std::runtime_error
{
	const restinio::http_status_line_t m_response_status;
	const model::error_description_t m_error_description;

public:
	request_processing_failure_t(
		restinio::http_status_line_t response_status,
		model::error_description_t error_description)
		:	std::runtime_error("request processing failure")
		,	m_response_status{std::move(response_status)}
		,	m_error_description{std::move(error_description)}
	{}

	const auto &
	response_status() const noexcept
	{
		return m_response_status;
	}

	const auto &
	error_description() const noexcept
	{
		return m_error_description;
	}
};

namespace
{

// Helper function for wrapping request processing routine.
// Failures are converted into JSON responses.
template<typename F>
response_t
wrap_request_processing(F && functor)
{
	try
	{
		return functor();
	}
	catch(const request_processing_failure_t & x)
	{
		spdlog::debug("request rejected: {} {}",
				x.response_status().status_code().raw_code(),
				x.error_description().m_error);
		return make_json_response(x.response_status(), x.error_description());
	}
	catch(const std::exception & x)
	{
		spdlog::error("unexpected failure during request processing: {}",
				x.what());
		return make_json_response(
				restinio::status_internal_server_error(),
				model::error_description_t{ "unexpected application failure" });
	}
}

void
send_response(
	const restinio::request_handle_t & req,
	response_t response)
{
	auto builder = req->create_response(std::move(response.m_status));
	builder.append_header_date_field()
		.append_header(restinio::http_field::content_type,
				std::move(response.m_content_type));
	if(response.m_location)
		builder.append_header(restinio::http_field::location,
				std::move(*response.m_location));

	builder.set_body(std::move(response.m_body))
		.done();
}

nonstd::optional<std::string>
opt_header_value(
	const restinio::request_handle_t & req,
	restinio::http_field_t field)
{
	const auto value = req->header().opt_value_of(field);
	if(!value)
		return nonstd::nullopt;

	return std::string{ value->data(), value->size() };
}

item_id_t
parse_item_id(const std::string & id_text)
{
	try
	{
		return restinio::cast_to<item_id_t>(restinio::string_view_t{id_text});
	}
	catch(const restinio::exception_t &)
	{
		throw request_processing_failure_t(
				restinio::status_bad_request(),
				model::error_description_t{ "Invalid item ID format" });
	}
}

[[noreturn]] void
throw_item_not_found(item_id_t id)
{
	throw request_processing_failure_t(
			restinio::status_not_found(),
			model::error_description_t{
					fmt::format("Item {} not found", id) });
}

} /* namespace anonymous */

incoming_request_t
make_incoming_request(const restinio::request_handle_t & req)
{
	return incoming_request_t{
			opt_header_value(req, restinio::http_field::content_type),
			opt_header_value(req, restinio::http_field::accept),
			req->body() };
}

request_processor_t::request_processor_t(item_store_t & store)
	:	m_store{store}
{
}

void
request_processor_t::on_home_page(
	const restinio::request_handle_t & req)
{
	send_response(req, handle_home_page());
}

void
request_processor_t::on_items_page(
	const restinio::request_handle_t & req)
{
	send_response(req, handle_items_page());
}

void
request_processor_t::on_create_form(
	const restinio::request_handle_t & req)
{
	send_response(req, handle_create_form());
}

void
request_processor_t::on_get_all_items(
	const restinio::request_handle_t & req)
{
	send_response(req, handle_get_all_items(make_incoming_request(req)));
}

void
request_processor_t::on_create_new_item(
	const restinio::request_handle_t & req)
{
	send_response(req, handle_create_new_item(make_incoming_request(req)));
}

void
request_processor_t::on_get_specific_item(
	const restinio::request_handle_t & req,
	const std::string & id_text)
{
	send_response(req, handle_get_specific_item(id_text));
}

void
request_processor_t::on_delete_specific_item(
	const restinio::request_handle_t & req,
	const std::string & id_text)
{
	send_response(req, handle_delete_specific_item(id_text));
}

response_t
request_processor_t::handle_home_page()
{
	return make_html_response(restinio::status_ok(), render_home_page());
}

response_t
request_processor_t::handle_items_page()
{
	return wrap_request_processing([&] {
			return renderer_for(response_format_t::html).items_list(
					m_store.get_all_items());
		});
}

response_t
request_processor_t::handle_create_form()
{
	return make_html_response(
			restinio::status_ok(),
			render_create_form(model::new_item_input_t{}, std::string{}));
}

response_t
request_processor_t::handle_get_all_items(const incoming_request_t & req)
{
	return wrap_request_processing([&] {
			return renderer_for(detect_response_format(req)).items_list(
					m_store.get_all_items());
		});
}

response_t
request_processor_t::handle_create_new_item(const incoming_request_t & req)
{
	return wrap_request_processing([&] {
			// The format is detected once and used for every outcome.
			const auto & renderer = renderer_for(detect_response_format(req));

			const auto input = bind_new_item_input(req);
			if(!input)
			{
				spdlog::debug("unable to bind new item: {}",
						input.error().m_description);
				return renderer.invalid_submission(
						input.error().m_partial_input,
						input.error().m_description);
			}

			const auto valid_input = validate_new_item(*input);
			if(!valid_input)
			{
				const auto message = valid_input.error().message();
				spdlog::debug("new item rejected: {}", message);
				return renderer.invalid_submission(*input, message);
			}

			const auto item = m_store.create_item(
					valid_input->m_name, valid_input->m_is_active);
			spdlog::debug("item created, id={}", item.m_id);

			return renderer.item_created(item);
		});
}

response_t
request_processor_t::handle_get_specific_item(const std::string & id_text)
{
	return wrap_request_processing([&] {
			return make_json_response(
					restinio::status_ok(),
					get_specific_item(id_text));
		});
}

response_t
request_processor_t::handle_delete_specific_item(const std::string & id_text)
{
	return wrap_request_processing([&] {
			return make_json_response(
					restinio::status_ok(),
					delete_specific_item(id_text));
		});
}

model::item_representation_t
request_processor_t::get_specific_item(const std::string & id_text)
{
	const auto id = parse_item_id(id_text);

	auto item = m_store.get_item(id);
	if(!item)
		throw_item_not_found(id);

	return model::make_representation(*item);
}

model::delete_confirmation_t
request_processor_t::delete_specific_item(const std::string & id_text)
{
	const auto id = parse_item_id(id_text);

	if(item_store_t::delete_result_t::deleted != m_store.delete_item(id))
		throw_item_not_found(id);

	spdlog::debug("item deleted, id={}", id);

	return model::delete_confirmation_t{
			"Item deleted successfully",
			std::to_string(id) };
}

} /* namespace items_service */
