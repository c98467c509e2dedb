#include "request_processor.hpp"

#include <rapidjson/document.h>

#include <iostream>
#include <limits>
#include <string>
#include <thread>

using namespace items_service;

namespace
{

int failures = 0;

void
check(bool condition, const std::string & what)
{
	if(!condition)
	{
		std::cerr << "FAILED: " << what << std::endl;
		++failures;
	}
}

std::uint16_t
status_of(const response_t & response)
{
	return response.m_status.status_code().raw_code();
}

rapidjson::Document
parse_body(const response_t & response)
{
	rapidjson::Document doc;
	doc.Parse(response.m_body.c_str());
	check(!doc.HasParseError(), "body is valid JSON: " + response.m_body);
	return doc;
}

bool
contains(const std::string & text, const std::string & what)
{
	return std::string::npos != text.find(what);
}

incoming_request_t
json_request(std::string body)
{
	return incoming_request_t{
			std::string{"application/json"},
			std::string{"application/json"},
			std::move(body) };
}

incoming_request_t
form_request(std::string body)
{
	return incoming_request_t{
			std::string{"application/x-www-form-urlencoded"},
			std::string{"text/html,application/xhtml+xml,*/*;q=0.8"},
			std::move(body) };
}

void
create_active_item_via_json()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			json_request(R"({"name":"Foo","isActive":true})"));

	check(201 == status_of(response), "create returns 201");
	check("application/json" == response.m_content_type,
			"create returns JSON");

	const auto doc = parse_body(response);
	check(doc.IsObject(), "created item is an object");
	if(doc.IsObject())
	{
		check(doc.HasMember("id") && 1 == doc["id"].GetInt(), "id is 1");
		check(doc.HasMember("name") &&
					std::string{"Foo"} == doc["name"].GetString(),
				"name is Foo");
		check(doc.HasMember("isActive") && doc["isActive"].GetBool(),
				"isActive is true");
		check(doc.HasMember("createdAt") && doc["createdAt"].IsString(),
				"createdAt is present");
		if(doc.HasMember("createdAt"))
		{
			const std::string created_at = doc["createdAt"].GetString();
			check(!created_at.empty() && 'Z' == created_at.back(),
					"createdAt is UTC RFC 3339");
		}
	}

	check(1u == store.get_all_items().size(), "item is stored");
}

void
inactive_item_omits_flag()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			json_request(R"({"name":"Bar"})"));
	check(201 == status_of(response), "create without isActive returns 201");
	check(!contains(response.m_body, "isActive"),
			"isActive is omitted when false");
}

void
create_then_get_returns_same_item()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto created = processor.handle_create_new_item(
			json_request(R"({"name":"Foo","isActive":true})"));
	const auto fetched = processor.handle_get_specific_item("1");

	check(200 == status_of(fetched), "get returns 200");
	check(created.m_body == fetched.m_body,
			"get returns the item returned by create");
}

void
too_long_name_is_rejected_for_json()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			json_request(R"({"name":"TooLongName","isActive":false})"));

	check(400 == status_of(response), "too long name returns 400");
	const auto doc = parse_body(response);
	check(doc.IsObject() && doc.HasMember("error"), "error field is present");
	if(doc.IsObject() && doc.HasMember("error"))
	{
		const std::string error = doc["error"].GetString();
		check(contains(error, "Invalid input: "), "error has prefix");
		check(contains(error, "at most 10"),
				"error mentions the maximal length");
	}
	check(store.get_all_items().empty(), "store isn't changed");
}

void
malformed_json_is_rejected()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			json_request(R"({"name":)"));
	check(400 == status_of(response), "malformed JSON returns 400");
	check(contains(response.m_body, "\"error\""), "error body is returned");

	const auto wrong_type = processor.handle_create_new_item(
			json_request(R"({"name":42})"));
	check(400 == status_of(wrong_type), "wrong field type returns 400");

	check(store.get_all_items().empty(), "store isn't changed");
}

void
unsupported_content_type_is_rejected()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			incoming_request_t{
					std::string{"text/plain"},
					nonstd::nullopt,
					std::string{"name=Foo"} });
	check(400 == status_of(response), "text/plain returns 400");
	check(contains(response.m_body, "unsupported Content-Type"),
			"error names the Content-Type problem");
}

void
form_submission_redirects_to_list()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			form_request("name=Foo&isActive=on"));

	check(302 == status_of(response), "form submission returns 302");
	check(response.m_location && "/items" == *response.m_location,
			"redirect goes to the items page");

	const auto items = store.get_all_items();
	check(1u == items.size(), "item is stored");
	if(1u == items.size())
	{
		check("Foo" == items.front().m_name, "name from form");
		check(items.front().m_is_active, "checkbox means active");
	}
}

void
invalid_form_submission_rerenders_form()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			form_request("name=ab%3Cx&isActive=on"));

	check(200 == status_of(response), "invalid form returns 200");
	check(contains(response.m_content_type, "text/html"), "form is HTML");
	check(contains(response.m_body, "error-message"), "form has error banner");
	check(contains(response.m_body, "must contain only alphabetic"),
			"banner has validation message");
	check(contains(response.m_body, "value=\"ab&lt;x\""),
			"submitted name is kept and escaped");
	check(contains(response.m_body, " checked"),
			"submitted checkbox is kept");
	check(store.get_all_items().empty(), "store isn't changed");
}

void
bad_checkbox_value_rerenders_form()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			form_request("name=Foo&isActive=maybe"));

	check(200 == status_of(response), "bad checkbox value returns 200");
	check(contains(response.m_body, "isActive has invalid value"),
			"banner names the bad field");
	check(contains(response.m_body, "value=\"Foo\""),
			"name bound before the failure is kept");
	check(store.get_all_items().empty(), "store isn't changed");
}

void
get_unknown_item_is_not_found()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto response = processor.handle_get_specific_item("999");
	check(404 == status_of(response), "unknown id returns 404");
	check(contains(response.m_body, "999"), "error mentions the id");
}

void
malformed_id_is_bad_request()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto get = processor.handle_get_specific_item("abc");
	check(400 == status_of(get), "get with id 'abc' returns 400");
	check(contains(get.m_body, "Invalid item ID format"),
			"error tells about ID format");

	const auto del = processor.handle_delete_specific_item("12x");
	check(400 == status_of(del), "delete with id '12x' returns 400");
}

void
ids_beyond_32_bits_are_integers()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto get = processor.handle_get_specific_item("2147483648");
	check(404 == status_of(get), "get with id 2147483648 returns 404");
	check(contains(get.m_body, "Item 2147483648 not found"),
			"error mentions the large id");

	const auto del = processor.handle_delete_specific_item("-5");
	check(404 == status_of(del), "delete with negative id returns 404");

	const auto huge = processor.handle_get_specific_item(
			"9223372036854775808");
	check(400 == status_of(huge), "id beyond 64 bits returns 400");
}

void
exhausted_ids_give_server_error()
{
	item_store_t store{ std::numeric_limits<item_id_t>::max() };
	request_processor_t processor{ store };

	const auto response = processor.handle_create_new_item(
			json_request(R"({"name":"Foo"})"));
	check(500 == status_of(response), "create without free ids returns 500");
	check(contains(response.m_body, "unexpected application failure"),
			"error body is returned");
	check(store.get_all_items().empty(), "store isn't changed");
}

void
delete_then_get_is_not_found()
{
	item_store_t store;
	request_processor_t processor{ store };

	processor.handle_create_new_item(json_request(R"({"name":"Foo"})"));

	const auto deleted = processor.handle_delete_specific_item("1");
	check(200 == status_of(deleted), "delete returns 200");
	const auto doc = parse_body(deleted);
	if(doc.IsObject())
	{
		check(doc.HasMember("message") &&
					std::string{"Item deleted successfully"} ==
							doc["message"].GetString(),
				"confirmation message");
		check(doc.HasMember("id") && doc["id"].IsString() &&
					std::string{"1"} == doc["id"].GetString(),
				"confirmation has the id as string");
	}

	check(404 == status_of(processor.handle_get_specific_item("1")),
			"deleted item isn't found");
	check(404 == status_of(processor.handle_delete_specific_item("1")),
			"second delete returns 404");
	check(404 == status_of(processor.handle_delete_specific_item("1")),
			"third delete returns 404 too");
}

void
list_negotiates_format()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto empty_json = processor.handle_get_all_items(json_request(""));
	check(200 == status_of(empty_json), "list returns 200");
	check("[]" == empty_json.m_body, "empty list is an empty array");

	const auto empty_html = processor.handle_get_all_items(form_request(""));
	check(contains(empty_html.m_content_type, "text/html"),
			"browser gets HTML list");
	check(contains(empty_html.m_body, "No items found"),
			"empty HTML list has a message");

	processor.handle_create_new_item(json_request(R"({"name":"Foo"})"));
	processor.handle_create_new_item(json_request(R"({"name":"Bar"})"));

	const auto doc = parse_body(processor.handle_get_all_items(json_request("")));
	check(doc.IsArray() && 2u == doc.Size(), "list has two items");

	const auto page = processor.handle_items_page();
	check(contains(page.m_body, "<table"), "items page has a table");
	check(contains(page.m_body, "Foo") && contains(page.m_body, "Bar"),
			"items page lists names");
	check(contains(page.m_body, "Inactive"), "items page shows status");
}

void
concurrent_creates_get_consecutive_ids()
{
	item_store_t store;
	request_processor_t processor{ store };

	nonstd::optional<response_t> first;
	nonstd::optional<response_t> second;
	std::thread a{ [&] {
			first = processor.handle_create_new_item(
					json_request(R"({"name":"Foo"})"));
		} };
	std::thread b{ [&] {
			second = processor.handle_create_new_item(
					json_request(R"({"name":"Bar"})"));
		} };
	a.join();
	b.join();

	check(first && second, "both creates are completed");
	if(!first || !second)
		return;

	check(201 == status_of(*first) && 201 == status_of(*second),
			"both creates succeed");

	const auto first_doc = parse_body(*first);
	const auto second_doc = parse_body(*second);
	if(first_doc.IsObject() && second_doc.IsObject())
	{
		const auto id_a = first_doc["id"].GetInt();
		const auto id_b = second_doc["id"].GetInt();
		check(id_a != id_b, "ids are distinct");
		check(3 == id_a + id_b, "ids are 1 and 2");
	}
}

void
html_pages_are_rendered()
{
	item_store_t store;
	request_processor_t processor{ store };

	const auto home = processor.handle_home_page();
	check(200 == status_of(home), "home page returns 200");
	check(contains(home.m_body, "href=\"/create\""), "home links to form");

	const auto form = processor.handle_create_form();
	check(200 == status_of(form), "form page returns 200");
	check(contains(form.m_body, "action=\"/api/v1/items\""),
			"form posts to the API");
	check(!contains(form.m_body, "error-message"),
			"fresh form has no error banner");
}

} /* namespace anonymous */

int main()
{
	create_active_item_via_json();
	inactive_item_omits_flag();
	create_then_get_returns_same_item();
	too_long_name_is_rejected_for_json();
	malformed_json_is_rejected();
	unsupported_content_type_is_rejected();
	form_submission_redirects_to_list();
	invalid_form_submission_rerenders_form();
	bad_checkbox_value_rerenders_form();
	get_unknown_item_is_not_found();
	malformed_id_is_bad_request();
	ids_beyond_32_bits_are_integers();
	exhausted_ids_give_server_error();
	delete_then_get_is_not_found();
	list_negotiates_format();
	concurrent_creates_get_consecutive_ids();
	html_pages_are_rendered();

	if(failures)
	{
		std::cerr << failures << " check(s) failed" << std::endl;
		return 1;
	}

	return 0;
}
