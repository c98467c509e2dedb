#pragma once

#include <restinio/http_headers.hpp>

#include <json_dto/pub.hpp>

#include <nonstd/optional.hpp>

#include <string>

namespace items_service
{

// Parts of an incoming request that are used by request handlers.
struct incoming_request_t
{
	nonstd::optional<std::string> m_content_type;
	nonstd::optional<std::string> m_accept;
	std::string m_body;
};

// A response prepared by a request handler but not sent yet.
struct response_t
{
	restinio::http_status_line_t m_status;
	std::string m_content_type;
	std::string m_body;
	// Value for Location HTTP-field, if any.
	nonstd::optional<std::string> m_location;
};

template<typename Dto>
response_t
make_json_response(restinio::http_status_line_t status, const Dto & dto)
{
	return response_t{
			std::move(status),
			"application/json",
			json_dto::to_json(dto),
			nonstd::nullopt };
}

inline response_t
make_html_response(restinio::http_status_line_t status, std::string body)
{
	return response_t{
			std::move(status),
			"text/html; charset=utf-8",
			std::move(body),
			nonstd::nullopt };
}

// 302 Found, the browser repeats the request to `location` with GET.
inline response_t
make_redirect_response(std::string location)
{
	return response_t{
			restinio::status_found(),
			"text/plain; charset=utf-8",
			std::string{},
			std::move(location) };
}

} /* namespace items_service */
