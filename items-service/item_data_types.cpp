#include "item_data_types.hpp"

#include "time_format.hpp"

namespace items_service
{

namespace model
{

item_representation_t
make_representation(const item_t & item)
{
	item_representation_t result;
	result.m_id = item.m_id;
	result.m_name = item.m_name;
	result.m_created_at = format_rfc3339(item.m_created_at);
	if(item.m_is_active)
		result.m_is_active = true;

	return result;
}

item_list_representation_t
make_representation(const std::vector<item_t> & items)
{
	item_list_representation_t result;
	result.reserve(items.size());
	for(const auto & item : items)
		result.push_back(make_representation(item));

	return result;
}

} /* namespace model */

} /* namespace items_service */
