#pragma once

#include <json_dto/pub.hpp>

#include <nonstd/optional.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace items_service
{

using item_id_t = std::int64_t;

namespace model
{

// The stored record. Instances are created only by item_store_t.
struct item_t
{
	item_id_t m_id;
	std::string m_name;
	std::chrono::system_clock::time_point m_created_at;
	bool m_is_active;
};

// The data sent by a client for creation of a new item.
//
// Both fields are optional on the wire: the absence of the name is
// reported by the validator, not by the JSON binding.
struct new_item_input_t
{
	std::string m_name;
	bool m_is_active{false};

	template<typename Json_Io>
	void json_io(Json_Io & io)
	{
		io & json_dto::optional("name", m_name, std::string{})
			& json_dto::optional("isActive", m_is_active, false);
	}
};

// JSON representation of an item.
struct item_representation_t
{
	item_id_t m_id;
	std::string m_name;
	std::string m_created_at;
	// Is empty when the item is not active, so the field is omitted.
	nonstd::optional<bool> m_is_active;

	template<typename Json_Io>
	void json_io(Json_Io & io)
	{
		io & json_dto::mandatory("id", m_id)
			& json_dto::mandatory("name", m_name)
			& json_dto::mandatory("createdAt", m_created_at)
			& json_dto::optional_no_default("isActive", m_is_active);
	}
};

using item_list_representation_t = std::vector<item_representation_t>;

struct delete_confirmation_t
{
	std::string m_message;
	// Existing clients expect the id as a string.
	std::string m_id;

	template<typename Json_Io>
	void json_io(Json_Io & io)
	{
		io & json_dto::mandatory("message", m_message)
			& json_dto::mandatory("id", m_id);
	}
};

// Type of object to be returned in a HTTP-response for a failed request.
struct error_description_t
{
	std::string m_error;

	template<typename Json_Io>
	void json_io(Json_Io & io)
	{
		io & json_dto::mandatory("error", m_error);
	}
};

item_representation_t
make_representation(const item_t & item);

item_list_representation_t
make_representation(const std::vector<item_t> & items);

} /* namespace model */

} /* namespace items_service */
