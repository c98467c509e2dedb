#pragma once

#include <restinio/expected.hpp>

#include "item_data_types.hpp"

#include <cstddef>
#include <string>

namespace items_service
{

// Constraints for the name of an item.
const std::size_t min_name_length = 3u;
const std::size_t max_name_length = 10u;

// Description of the first violated constraint.
struct validation_failure_t
{
	enum class kind_t
	{
		missing,
		too_short,
		too_long,
		not_alphabetic
	};

	std::string m_field;
	kind_t m_kind;

	std::string
	message() const;
};

// Checks the rules for a new item one by one. The first failed rule
// determines the result.
restinio::expected_t<model::new_item_input_t, validation_failure_t>
validate_new_item(model::new_item_input_t input);

} /* namespace items_service */
