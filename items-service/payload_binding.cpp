#include "payload_binding.hpp"

#include "negotiation.hpp"

#include <restinio/uri_helpers.hpp>

#include <fmt/format.h>

namespace items_service
{

namespace
{

// Values produced by HTML checkboxes plus the usual spellings of
// booleans.
nonstd::optional<bool>
parse_form_bool(restinio::string_view_t value)
{
	static const char * const true_values[] = {
		"on", "1", "t", "T", "TRUE", "true", "True"
	};
	static const char * const false_values[] = {
		"off", "0", "f", "F", "FALSE", "false", "False"
	};

	for(const auto * v : true_values)
		if(value == v)
			return true;
	for(const auto * v : false_values)
		if(value == v)
			return false;

	return nonstd::nullopt;
}

restinio::expected_t<model::new_item_input_t, binding_failure_t>
bind_from_json(const std::string & body)
{
	try
	{
		return json_dto::from_json<model::new_item_input_t>(body);
	}
	catch(const json_dto::ex_t & x)
	{
		return restinio::make_unexpected(binding_failure_t{
				fmt::format("malformed JSON payload: {}", x.what()),
				model::new_item_input_t{} });
	}
}

restinio::expected_t<model::new_item_input_t, binding_failure_t>
bind_from_form(const std::string & body)
{
	using namespace restinio;

	model::new_item_input_t result;

	const auto params = try_parse_query<
			parse_query_traits::x_www_form_urlencoded>(body);
	if(!params)
		return make_unexpected(binding_failure_t{
				"malformed form payload",
				result });

	if(params->has("name"))
	{
		const auto name = (*params)["name"];
		result.m_name.assign(name.data(), name.size());
	}

	if(params->has("isActive"))
	{
		const auto raw = (*params)["isActive"];
		const auto is_active = parse_form_bool(raw);
		if(!is_active)
			return make_unexpected(binding_failure_t{
					fmt::format("isActive has invalid value '{}'",
							fmt::string_view{raw.data(), raw.size()}),
					result });
		result.m_is_active = *is_active;
	}

	return result;
}

} /* namespace anonymous */

restinio::expected_t<model::new_item_input_t, binding_failure_t>
bind_new_item_input(const incoming_request_t & req)
{
	if(is_json(req))
		return bind_from_json(req.m_body);

	if(is_form_urlencoded(req))
		return bind_from_form(req.m_body);

	return restinio::make_unexpected(binding_failure_t{
			"unsupported Content-Type",
			model::new_item_input_t{} });
}

} /* namespace items_service */
