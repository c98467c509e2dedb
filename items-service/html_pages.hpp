#pragma once

#include "item_data_types.hpp"

#include <string>
#include <vector>

namespace items_service
{

// Replaces HTML special characters with entities.
std::string
html_escape(const std::string & text);

std::string
render_home_page();

// A table with all items or a "no items" message for an empty list.
std::string
render_items_page(const std::vector<model::item_t> & items);

// The form for creation of a new item.
//
// If `error_message` isn't empty the form is shown with an error banner
// and with fields filled from `input`.
std::string
render_create_form(
	const model::new_item_input_t & input,
	const std::string & error_message);

} /* namespace items_service */
