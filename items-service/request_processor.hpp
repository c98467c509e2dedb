#pragma once

#include <restinio/all.hpp>

#include <string>

#include "item_store.hpp"
#include "response.hpp"

namespace items_service
{

// Extracts the parts of a RESTinio request used by the handlers.
incoming_request_t
make_incoming_request(const restinio::request_handle_t & req);

class request_processor_t
{
public:
	request_processor_t(item_store_t & store);

	//
	// Entry points for the router. Every method completes the request.
	//

	void
	on_home_page(
		const restinio::request_handle_t & req);

	void
	on_items_page(
		const restinio::request_handle_t & req);

	void
	on_create_form(
		const restinio::request_handle_t & req);

	void
	on_get_all_items(
		const restinio::request_handle_t & req);

	void
	on_create_new_item(
		const restinio::request_handle_t & req);

	void
	on_get_specific_item(
		const restinio::request_handle_t & req,
		const std::string & id_text);

	void
	on_delete_specific_item(
		const restinio::request_handle_t & req,
		const std::string & id_text);

	//
	// Handlers that don't depend on a connection.
	//

	response_t
	handle_home_page();

	response_t
	handle_items_page();

	response_t
	handle_create_form();

	response_t
	handle_get_all_items(const incoming_request_t & req);

	response_t
	handle_create_new_item(const incoming_request_t & req);

	response_t
	handle_get_specific_item(const std::string & id_text);

	response_t
	handle_delete_specific_item(const std::string & id_text);

private:
	item_store_t & m_store;

	model::item_representation_t
	get_specific_item(const std::string & id_text);

	model::delete_confirmation_t
	delete_specific_item(const std::string & id_text);
};

} /* namespace items_service */
