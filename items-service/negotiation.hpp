#pragma once

#include "response.hpp"

namespace items_service
{

enum class response_format_t
{
	json,
	html
};

// Decides what kind of response the caller expects.
//
// Accept HTTP-field is checked first: application/json wins over
// text/html if its weight isn't lower. If Accept doesn't say anything
// definite (absent, unparsable or just */*) a form-encoded request body
// means a browser form submission and HTML is used, otherwise JSON.
response_format_t
detect_response_format(const incoming_request_t & req);

// Content-Type of the request is application/x-www-form-urlencoded.
bool
is_form_urlencoded(const incoming_request_t & req);

// Content-Type of the request is application/json.
bool
is_json(const incoming_request_t & req);

} /* namespace items_service */
