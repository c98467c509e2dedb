#pragma once

#include <restinio/expected.hpp>

#include "item_data_types.hpp"
#include "response.hpp"

#include <string>

namespace items_service
{

// The payload of a create request can't be decoded.
struct binding_failure_t
{
	std::string m_description;
	// Fields that were decoded before the failure. Used for
	// re-rendering of the creation form.
	model::new_item_input_t m_partial_input;
};

// Decodes a new item from a JSON or form-encoded request body.
// The kind of the body is detected by Content-Type.
restinio::expected_t<model::new_item_input_t, binding_failure_t>
bind_new_item_input(const incoming_request_t & req);

} /* namespace items_service */
