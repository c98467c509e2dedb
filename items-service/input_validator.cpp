#include "input_validator.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace items_service
{

namespace
{

// Length of UTF-8 text in code points.
std::size_t
code_point_count(const std::string & text) noexcept
{
	return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
			[](char ch) {
				return 0x80 != (static_cast<unsigned char>(ch) & 0xC0);
			}));
}

bool
is_ascii_letter(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

struct name_rule_t
{
	validation_failure_t::kind_t m_failure;
	bool (*m_is_satisfied)(const std::string &);
};

// The order matters.
const name_rule_t name_rules[] = {
	{ validation_failure_t::kind_t::missing,
		[](const std::string & name) { return !name.empty(); } },
	{ validation_failure_t::kind_t::too_short,
		[](const std::string & name) {
			return code_point_count(name) >= min_name_length;
		} },
	{ validation_failure_t::kind_t::too_long,
		[](const std::string & name) {
			return code_point_count(name) <= max_name_length;
		} },
	{ validation_failure_t::kind_t::not_alphabetic,
		[](const std::string & name) {
			return std::all_of(name.begin(), name.end(), is_ascii_letter);
		} }
};

} /* namespace anonymous */

std::string
validation_failure_t::message() const
{
	switch(m_kind)
	{
	case kind_t::missing:
		return fmt::format("{} is required", m_field);

	case kind_t::too_short:
		return fmt::format("{} must be at least {} characters long",
				m_field, min_name_length);

	case kind_t::too_long:
		return fmt::format("{} must be at most {} characters long",
				m_field, max_name_length);

	case kind_t::not_alphabetic:
		return fmt::format("{} must contain only alphabetic characters",
				m_field);
	}

	return fmt::format("{} is invalid", m_field);
}

restinio::expected_t<model::new_item_input_t, validation_failure_t>
validate_new_item(model::new_item_input_t input)
{
	for(const auto & rule : name_rules)
	{
		if(!rule.m_is_satisfied(input.m_name))
			return restinio::make_unexpected(
					validation_failure_t{"name", rule.m_failure});
	}

	return input;
}

} /* namespace items_service */
