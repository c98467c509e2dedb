#include "response_renderers.hpp"

#include "html_pages.hpp"

namespace items_service
{

response_t
json_renderer_t::items_list(const std::vector<model::item_t> & items) const
{
	return make_json_response(
			restinio::status_ok(),
			model::make_representation(items));
}

response_t
json_renderer_t::item_created(const model::item_t & item) const
{
	return make_json_response(
			restinio::status_created(),
			model::make_representation(item));
}

response_t
json_renderer_t::invalid_submission(
	const model::new_item_input_t &,
	const std::string & error_message) const
{
	return make_json_response(
			restinio::status_bad_request(),
			model::error_description_t{ "Invalid input: " + error_message });
}

response_t
html_renderer_t::items_list(const std::vector<model::item_t> & items) const
{
	return make_html_response(restinio::status_ok(), render_items_page(items));
}

response_t
html_renderer_t::item_created(const model::item_t &) const
{
	return make_redirect_response("/items");
}

response_t
html_renderer_t::invalid_submission(
	const model::new_item_input_t & submitted,
	const std::string & error_message) const
{
	return make_html_response(
			restinio::status_ok(),
			render_create_form(submitted, error_message));
}

const response_renderer_t &
renderer_for(response_format_t format) noexcept
{
	static const json_renderer_t json_renderer{};
	static const html_renderer_t html_renderer{};

	switch(format)
	{
	case response_format_t::html:
		return html_renderer;

	case response_format_t::json:
		break;
	}

	return json_renderer;
}

} /* namespace items_service */
