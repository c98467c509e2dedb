#include "html_pages.hpp"

#include "time_format.hpp"

#include <fmt/format.h>

namespace items_service
{

namespace
{

const char * const common_styles = R"---(
:root {
	--primary-color: #f9a825;
	--primary-light: #ffcc66;
	--secondary-color: #87ceeb;
	--bg-color: #0a0f2a;
	--text-color: #f0e6d2;
	--subtle-bg: #101535;
	--border-color: #333858;
}
body {
	font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, Arial, sans-serif;
	line-height: 1.7;
	color: var(--text-color);
	background-color: var(--bg-color);
	margin: 0;
}
.container { max-width: 1140px; width: 90%; margin: 0 auto; }
.app-header {
	border-bottom: 1px solid var(--border-color);
	padding: 1.5rem 0;
	margin-bottom: 2rem;
	text-align: center;
}
.app-header .logo {
	font-size: 1.8rem;
	font-weight: 700;
	color: var(--primary-light);
	text-decoration: none;
}
.app-header .logo span { color: var(--secondary-color); }
h1, h2 { text-align: center; }
.btn {
	display: inline-block;
	padding: 0.8rem 1.8rem;
	border-radius: 50px;
	text-decoration: none;
	font-weight: 600;
	cursor: pointer;
	border: none;
	margin: 0.25rem;
}
.btn-primary { background-color: var(--primary-color); color: var(--bg-color); }
.btn-secondary {
	background-color: transparent;
	color: var(--primary-light);
	border: 1px solid var(--primary-light);
}
.cta-buttons { display: flex; justify-content: center; gap: 1rem; margin-top: 2rem; }
.table {
	width: 100%;
	border-collapse: collapse;
	margin: 2rem 0;
	background-color: var(--subtle-bg);
	border: 1px solid var(--border-color);
}
.table th, .table td {
	padding: 1rem;
	text-align: left;
	border-bottom: 1px solid var(--border-color);
}
.table th { color: var(--primary-light); }
.form-group { margin-bottom: 1.5rem; }
.form-group label { display: block; margin-bottom: 0.5rem; color: var(--primary-light); }
.form-group input[type="text"] {
	width: 100%;
	padding: 0.75rem;
	border: 1px solid var(--border-color);
	border-radius: 4px;
	background-color: var(--subtle-bg);
	color: var(--text-color);
}
.form-actions { margin-top: 2rem; display: flex; gap: 1rem; }
.error-message { color: #ff6b6b; font-weight: 500; margin-bottom: 1rem; }
)---";

// Wraps the content of <main> into a complete document.
std::string
make_document(const char * title, const std::string & main_content)
{
	std::string result;
	result += "<!DOCTYPE html>\n<html>\n<head>\n"
			"<meta charset=\"UTF-8\">\n";
	result += fmt::format("<title>{}</title>\n", title);
	result += "<style>";
	result += common_styles;
	result += "</style>\n</head>\n<body>\n"
			"<header class=\"app-header\">"
			"<a href=\"/\" class=\"logo\">Items<span>Service</span></a>"
			"</header>\n"
			"<main class=\"container\">\n<section class=\"content-section\">\n"
			"<div class=\"container\">\n";
	result += main_content;
	result += "</div>\n</section>\n</main>\n</body>\n</html>\n";

	return result;
}

std::string
make_items_table(const std::vector<model::item_t> & items)
{
	std::string rows;
	for(const auto & item : items)
	{
		rows += fmt::format(
				"<tr><td>{0}</td><td>{1}</td><td>{2}</td><td>{3}</td>"
				"<td><a href=\"/api/v1/items/{0}\" class=\"btn btn-secondary\">"
				"View JSON</a></td></tr>\n",
				item.m_id,
				html_escape(item.m_name),
				format_for_humans(item.m_created_at),
				item.m_is_active ? "Active" : "Inactive");
	}

	return "<table class=\"table\">\n<thead><tr>"
			"<th>ID</th><th>Name</th><th>Created At</th>"
			"<th>Status</th><th>Actions</th>"
			"</tr></thead>\n<tbody>\n" + rows + "</tbody>\n</table>\n";
}

} /* namespace anonymous */

std::string
html_escape(const std::string & text)
{
	std::string result;
	result.reserve(text.size());
	for(const char ch : text)
	{
		switch(ch)
		{
		case '&': result += "&amp;"; break;
		case '<': result += "&lt;"; break;
		case '>': result += "&gt;"; break;
		case '"': result += "&quot;"; break;
		case '\'': result += "&#39;"; break;
		default: result += ch;
		}
	}

	return result;
}

std::string
render_home_page()
{
	return make_document("Items Service",
			"<h1>Welcome to <span>Items Service</span></h1>\n"
			"<p>Items are available both as server-rendered pages "
			"and through the JSON API.</p>\n"
			"<h2>Explore</h2>\n"
			"<div class=\"cta-buttons\">"
			"<a href=\"/items\" class=\"btn btn-secondary\">View All Items</a>"
			"<a href=\"/create\" class=\"btn btn-secondary\">Create New Item</a>"
			"<a href=\"/api/v1/items\" class=\"btn btn-secondary\">Items API</a>"
			"</div>\n");
}

std::string
render_items_page(const std::vector<model::item_t> & items)
{
	std::string content = "<h1>Items Management</h1>\n";

	if(items.empty())
		content += "<p>No items found. "
				"Create your first item to get started!</p>\n";
	else
		content += make_items_table(items);

	content += "<div class=\"cta-buttons\">"
			"<a href=\"/\" class=\"btn btn-secondary\">Back to Home</a>"
			"<a href=\"/create\" class=\"btn btn-primary\">Create New Item</a>"
			"</div>\n";

	return make_document("Items List", content);
}

std::string
render_create_form(
	const model::new_item_input_t & input,
	const std::string & error_message)
{
	std::string content = "<h1>Create New Item</h1>\n";

	if(!error_message.empty())
		content += fmt::format("<div class=\"error-message\">{}</div>\n",
				html_escape(error_message));

	std::string name_value;
	if(!input.m_name.empty())
		name_value = fmt::format(" value=\"{}\"", html_escape(input.m_name));

	content += fmt::format(
			"<form method=\"POST\" action=\"/api/v1/items\" "
				"enctype=\"application/x-www-form-urlencoded\">\n"
			"<div class=\"form-group\">"
			"<label for=\"name\">Name:</label>"
			"<input type=\"text\" name=\"name\" id=\"name\" required "
				"maxlength=\"50\" placeholder=\"Enter item name\"{}>"
			"</div>\n"
			"<div class=\"form-group\"><label>"
			"<input type=\"checkbox\" name=\"isActive\" id=\"isActive\"{}>"
			" Item is active</label></div>\n"
			"<div class=\"form-actions\">"
			"<button type=\"submit\" class=\"btn btn-primary\">Create Item</button>"
			"<a href=\"/items\" class=\"btn btn-secondary\">Cancel</a>"
			"</div>\n"
			"</form>\n"
			"<br>\n"
			"<a href=\"/\" class=\"btn btn-secondary\">Back to Home</a>\n",
			name_value,
			input.m_is_active ? " checked" : "");

	return make_document("Create Item", content);
}

} /* namespace items_service */
