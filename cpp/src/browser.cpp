#include "browser.hpp"
#include "browser_model.hpp"
#include "trace.hpp"

#include <array>
#include <iomanip>
#include <sstream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>

std::ostream& operator <<(std::ostream& out, ftxui::Event event) {
	out << '"';
	for(unsigned char c : event.input()) {
		if(c < 0x20 || c >= 0x7f)
			out << "\\x" << std::hex << std::setw(2) << std::setfill('0')
				<< int(c) << std::dec << std::setfill(' ');
		else
			out << c;
	}
	return out << '"';
}

namespace {

struct browser_state {
	std::array<browser_page, 2> pages;
	bool file_count;
	ftxui::ScreenInteractive screen;
	int active = 0;
	std::array<int, 2> selected = { 0, 0 };
	int index = 0;
	std::vector<browser_row> rows = {};
	std::vector<std::string> labels = {};
};

browser_page& page_of(browser_state& st) {
	return st.pages[st.active];
}

void refresh(browser_state& st) {
	st.rows = page_of(st).rows();
	st.labels.clear();
	for(std::size_t i = 0; i < st.rows.size(); ++i)
		st.labels.push_back(std::to_string(i));
	if(st.index >= int(st.rows.size()))
		st.index = int(st.rows.size()) - 1;
	if(st.index < 0)
		st.index = 0;
}

const entry& current(browser_state& st) {
	return *st.rows.at(st.index).node;
}

void select(browser_state& st, const entry& node) {
	int row = page_of(st).row_of(node);
	if(row >= 0) st.index = row;
}

void switch_page(browser_state& st, bool follow) {
	std::string path = current(st).path;
	st.selected[st.active] = st.index;
	st.active ^= 1;
	st.index = st.selected[st.active];
	if(follow) {
		refresh(st);
		select(st, page_of(st).reveal(path));
	}
	refresh(st);
	trace(now, "page", st.active, "at", current(st).path);
}

void action_right(browser_state& st) {
	auto& page = page_of(st);
	const entry& node = current(st);
	if(!node.is_directory()) return;
	if(!page.is_expanded(node)) {
		page.expand(node);
		refresh(st);
		return;
	}
	if(auto child = page.first_child_directory(node))
		select(st, *child);
}

void action_left(browser_state& st) {
	auto& page = page_of(st);
	const entry& node = current(st);
	if(page.is_expanded(node)) {
		page.collapse(node);
		refresh(st);
		return;
	}
	if(auto parent = page.parent_of(node))
		select(st, *parent);
}

void action_hide(browser_state& st) {
	auto& page = page_of(st);
	const entry& node = current(st);
	auto parent = page.parent_of(node);
	if(parent == nullptr) return;
	const entry* next = parent;
	bool found = false;
	for(auto sibling : page.visible_children(*parent)) {
		if(sibling == &node) { found = true; continue; }
		if(!sibling->is_directory()) continue;
		next = sibling;
		if(found) break;
	}
	page.hide(node);
	refresh(st);
	select(st, *next);
}

bool handle_event(browser_state& st, const ftxui::Event& event) {
	if(event.is_mouse() || st.rows.empty()) return false;
	std::ostringstream input;
	input << event;
	trace(now, "event:", input.str());
	auto& page = page_of(st);
	if(event == ftxui::Event::Character('q')) {
		st.screen.Exit();
	} else if(event == ftxui::Event::Character(' ')) {
		switch_page(st, false);
	} else if(event == ftxui::Event::Tab) {
		switch_page(st, true);
	} else if(event == ftxui::Event::ArrowRight) {
		action_right(st);
	} else if(event == ftxui::Event::ArrowLeft) {
		action_left(st);
	} else if(event == ftxui::Event::F1) {
		page.toggle(current(st), true);
		refresh(st);
	} else if(event.is_character()
		&& event.character().size() == 1
		&& '1' <= event.character()[0] && event.character()[0] <= '9'
	) {
		page.expand_to_depth(current(st), event.character()[0] - '0');
		refresh(st);
	} else if(event == ftxui::Event::Character('d')) {
		action_hide(st);
	} else {
		return false;
	}
	return true;
}

ftxui::Color color_of(const browser_row& row) {
	if(row.depth == 0)
		return ftxui::Color::Red;
	if(row.shared)
		return row.node->is_directory() ? ftxui::Color::Yellow : ftxui::Color::Blue;
	return row.node->is_directory() ? ftxui::Color::Green : ftxui::Color::White;
}

decltype(ftxui::MenuEntryOption::transform) render_entry(browser_state& st) {
	return [&] (const ftxui::EntryState& state) {
		const auto& row = st.rows.at(std::stoi(state.label));
		std::ostringstream label;
		label << std::string(2 * row.depth, ' ');
		if(row.node->is_directory())
			label << (row.expanded ? "▾ " : "▸ ");
		else
			label << "  ";
		if(st.file_count && row.node->is_directory())
			label << '[' << row.count << "] ";
		label << (row.depth == 0 ? page_of(st).title() : row.node->name);
		auto elem = ftxui::text(label.str()) | ftxui::color(color_of(row));
		if(state.active) elem |= ftxui::inverted;
		if(state.focused) elem |= ftxui::bold;
		return elem;
	};
}

}

void browse(
	const std::string& left_title,
	const diff_tree& left,
	const std::string& right_title,
	const diff_tree& right,
	bool file_count
) {
	browser_state st =
		{ .pages =
			{ browser_page(left_title, left, right)
			, browser_page(right_title, right, left)
			}
		, .file_count = file_count
		, .screen = ftxui::ScreenInteractive::Fullscreen()
		};
	refresh(st);

	auto menuopt = ftxui::MenuOption::Vertical();
	menuopt.entries_option.transform = render_entry(st);
	auto menu = ftxui::Menu(&st.labels, &st.index, menuopt);

	std::vector<std::string> help =
		{ "[q] quit", "[space] switch views", "[tab] focus in other view"
		, "[F1] toggle all", "[1-9] toggle at depth", "[d] hide from view"
		};
	auto layout = ftxui::Renderer(menu, [&] () {
		ftxui::Elements keys;
		for(const auto& key : help)
			keys.push_back(ftxui::text(key) | ftxui::size(ftxui::WIDTH, ftxui::EQUAL, 27));
		return ftxui::vbox(
			{ ftxui::hbox(
				{ ftxui::text(std::to_string(st.active + 1) + "/2 ") | ftxui::bold
				, ftxui::text("Only in " + page_of(st).title())
				})
			, ftxui::separator()
			, menu->Render() | ftxui::yframe | ftxui::flex
			, ftxui::separator()
			, ftxui::hflow(keys)
			});
	});

	st.screen.Loop(layout | ftxui::CatchEvent([&] (ftxui::Event event) {
		return handle_event(st, event);
	}));
}
