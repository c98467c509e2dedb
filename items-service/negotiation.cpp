#include "negotiation.hpp"

#include <restinio/helpers/http_field_parsers/accept.hpp>
#include <restinio/helpers/http_field_parsers/content-type.hpp>

#include <algorithm>
#include <cctype>

namespace items_service
{

namespace
{

namespace hfp = restinio::http_field_parsers;

bool
equal_caseless(const std::string & a, const char * b) noexcept
{
	const std::size_t b_size = std::char_traits<char>::length(b);
	return a.size() == b_size &&
			std::equal(a.begin(), a.end(), b,
				[](char l, char r) {
					return std::tolower(static_cast<unsigned char>(l)) ==
							std::tolower(static_cast<unsigned char>(r));
				});
}

bool
content_type_is(
	const incoming_request_t & req,
	const char * type,
	const char * subtype)
{
	if(!req.m_content_type)
		return false;

	const auto content_type = hfp::content_type_value_t::try_parse(
			*req.m_content_type);
	if(!content_type)
		return false;

	return equal_caseless(content_type->media_type.type, type) &&
			equal_caseless(content_type->media_type.subtype, subtype);
}

// Weights of the acceptable formats, in thousandths. Zero means that
// a format wasn't mentioned or was explicitly refused.
struct accept_weights_t
{
	unsigned int m_json{0u};
	unsigned int m_html{0u};
};

accept_weights_t
weights_from_accept(const std::string & accept_field)
{
	accept_weights_t result;

	const auto accept = hfp::accept_value_t::try_parse(accept_field);
	if(!accept)
		return result;

	for(const auto & item : accept->items)
	{
		const unsigned int weight = item.weight ?
				static_cast<unsigned int>(item.weight->as_uint()) : 1000u;

		const auto & type = item.media_type.type;
		const auto & subtype = item.media_type.subtype;

		if(equal_caseless(type, "application") &&
				(equal_caseless(subtype, "json") || equal_caseless(subtype, "*")))
			result.m_json = std::max(result.m_json, weight);
		else if(equal_caseless(type, "text") &&
				(equal_caseless(subtype, "html") || equal_caseless(subtype, "*")))
			result.m_html = std::max(result.m_html, weight);
	}

	return result;
}

} /* namespace anonymous */

bool
is_form_urlencoded(const incoming_request_t & req)
{
	return content_type_is(req, "application", "x-www-form-urlencoded");
}

bool
is_json(const incoming_request_t & req)
{
	return content_type_is(req, "application", "json");
}

response_format_t
detect_response_format(const incoming_request_t & req)
{
	if(req.m_accept)
	{
		const auto weights = weights_from_accept(*req.m_accept);
		if(weights.m_json && weights.m_json >= weights.m_html)
			return response_format_t::json;
		if(weights.m_html)
			return response_format_t::html;
	}

	return is_form_urlencoded(req) ?
			response_format_t::html : response_format_t::json;
}

} /* namespace items_service */
