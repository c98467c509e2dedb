#pragma once

#include "item_data_types.hpp"
#include "negotiation.hpp"
#include "response.hpp"

#include <string>
#include <vector>

namespace items_service
{

// Interface of a strategy for making responses for operations that are
// available both for JSON and HTML clients.
class response_renderer_t
{
public:
	virtual ~response_renderer_t() = default;

	virtual response_t
	items_list(const std::vector<model::item_t> & items) const = 0;

	virtual response_t
	item_created(const model::item_t & item) const = 0;

	// The submitted data can't be bound or didn't pass the validation.
	virtual response_t
	invalid_submission(
		const model::new_item_input_t & submitted,
		const std::string & error_message) const = 0;
};

class json_renderer_t final : public response_renderer_t
{
public:
	response_t
	items_list(const std::vector<model::item_t> & items) const override;

	response_t
	item_created(const model::item_t & item) const override;

	response_t
	invalid_submission(
		const model::new_item_input_t & submitted,
		const std::string & error_message) const override;
};

class html_renderer_t final : public response_renderer_t
{
public:
	response_t
	items_list(const std::vector<model::item_t> & items) const override;

	// Redirects to the items page, so reloading that page doesn't
	// submit the form again.
	response_t
	item_created(const model::item_t & item) const override;

	// Shows the creation form again with the error and the submitted
	// values. The status is 200, the form itself reports the error.
	response_t
	invalid_submission(
		const model::new_item_input_t & submitted,
		const std::string & error_message) const override;
};

// Returns a reference to a stateless renderer for the format.
const response_renderer_t &
renderer_for(response_format_t format) noexcept;

} /* namespace items_service */
