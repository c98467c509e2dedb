#include "item_store.hpp"

#include <limits>
#include <stdexcept>

namespace items_service
{

item_store_t::item_store_t(item_id_t last_issued_id)
	:	m_last_id{last_issued_id}
{
	if(m_last_id < 0)
		throw std::invalid_argument("last issued item id can't be negative");
}

model::item_t
item_store_t::create_item(std::string name, bool is_active)
{
	std::lock_guard<std::mutex> lock{m_lock};

	if(std::numeric_limits<item_id_t>::max() == m_last_id)
		throw std::overflow_error("item identifiers are exhausted");

	model::item_t item;
	item.m_id = ++m_last_id;
	item.m_name = std::move(name);
	item.m_created_at = std::chrono::system_clock::now();
	item.m_is_active = is_active;

	m_items.emplace(item.m_id, item);

	return item;
}

std::vector<model::item_t>
item_store_t::get_all_items()
{
	std::vector<model::item_t> result;

	std::lock_guard<std::mutex> lock{m_lock};

	result.reserve(m_items.size());
	for(const auto & kv : m_items)
		result.push_back(kv.second);

	return result;
}

nonstd::optional<model::item_t>
item_store_t::get_item(item_id_t id)
{
	nonstd::optional<model::item_t> result;

	std::lock_guard<std::mutex> lock{m_lock};

	const auto it = m_items.find(id);
	if(it != m_items.end())
		result = it->second;

	return result;
}

item_store_t::delete_result_t
item_store_t::delete_item(item_id_t id)
{
	std::lock_guard<std::mutex> lock{m_lock};

	return 1u == m_items.erase(id) ?
			delete_result_t::deleted : delete_result_t::not_found;
}

} /* namespace items_service */
