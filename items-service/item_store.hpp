#pragma once

#include <nonstd/optional.hpp>

#include "item_data_types.hpp"

#include <map>
#include <mutex>
#include <vector>

namespace items_service
{

// In-memory storage of items.
//
// All operations are performed under the same lock, so a reader never
// sees a partially created or deleted item and the id counter is
// advanced together with the insertion.
class item_store_t
{
public:
	// The result of 'delete item' operation.
	enum class delete_result_t
	{
		deleted,
		not_found
	};

	item_store_t() = default;

	// The first created item gets `last_issued_id + 1`.
	explicit item_store_t(item_id_t last_issued_id);

	item_store_t(const item_store_t &) = delete;
	item_store_t & operator=(const item_store_t &) = delete;

	// Note: the name must be validated by the caller.
	//
	// Throws std::overflow_error if there are no identifiers left.
	model::item_t
	create_item(std::string name, bool is_active);

	// Returns a copy of all items ordered by id.
	std::vector<model::item_t>
	get_all_items();

	nonstd::optional<model::item_t>
	get_item(item_id_t id);

	delete_result_t
	delete_item(item_id_t id);

private:
	std::mutex m_lock;

	std::map<item_id_t, model::item_t> m_items;

	item_id_t m_last_id{0};
};

} /* namespace items_service */
