#include "ui/VirtualListView.h"

#include "ui/Theme.h"
#include "utils/Logger.h"

#include <FL/Fl.H>
#include <FL/fl_draw.H>

#include <algorithm>

VirtualListView::VirtualListView(int x, int y, int w, int h, ListConfig config, std::vector<std::string> rows)
    : Fl_Group(x, y, w, h), m_dataManager(std::move(config), std::move(rows)) {
    box(FL_NO_BOX);
    end();

    m_dataManager.setViewport(w, h);
    m_listenerId = m_dataManager.subscribe([this](const std::vector<RenderItem<std::string>> &items) {
        m_rows = items;
        redraw();
    });
}

VirtualListView::~VirtualListView() {
    m_dataManager.unsubscribe(m_listenerId);
    m_dataManager.destroy();
}

void VirtualListView::draw() {
    fl_push_clip(x(), y(), w(), h());

    fl_color(ThemeColors::BG_PRIMARY);
    fl_rectf(x(), y(), w(), h());

    const double offset = m_dataManager.list().scrollOffset();
    const double estimate = m_dataManager.list().config().estimatedSize.value_or(ListConfig::kDefaultEstimatedSize);

    for (const auto &row : m_rows) {
        if (row.style.position == VirtualScroll::StylePosition::Sticky) {
            continue;
        }
        const int rowY = y() + static_cast<int>(row.style.scrollAxisOffset - offset);
        drawRow(row, rowY, static_cast<int>(row.style.scrollAxisSize.value_or(estimate)));
    }

    for (const auto &row : m_rows) {
        if (row.style.layering != VirtualScroll::Layering::Elevated) {
            continue;
        }
        drawRow(row, y(), static_cast<int>(row.style.scrollAxisSize.value_or(estimate)));
    }

    drawScrollIndicator();
    fl_pop_clip();
}

void VirtualListView::drawRow(const RenderItem<std::string> &row, int rowY, int rowH) {
    const bool sticky = row.style.position == VirtualScroll::StylePosition::Sticky;

    if (sticky) {
        fl_color(ThemeColors::BG_STICKY);
    } else {
        fl_color(row.index % 2 ? ThemeColors::BG_ROW_ALT : ThemeColors::BG_PRIMARY);
    }
    fl_rectf(x(), rowY, w(), rowH);

    fl_color(ThemeColors::SEPARATOR);
    fl_line(x(), rowY + rowH - 1, x() + w(), rowY + rowH - 1);

    fl_color(sticky ? ThemeColors::TEXT_NORMAL : ThemeColors::TEXT_MUTED);
    fl_font(sticky ? FL_HELVETICA_BOLD : FL_HELVETICA, 14);

    const std::string text = row.item ? *row.item : "#" + std::to_string(row.index);
    fl_draw(text.c_str(), x() + ROW_PADDING, rowY, w() - 2 * ROW_PADDING, rowH, FL_ALIGN_LEFT | FL_ALIGN_INSIDE);
}

void VirtualListView::drawScrollIndicator() {
    const double total = m_dataManager.list().getTotalSize();
    if (total <= h()) {
        return;
    }

    const int thumbH = std::max(24, static_cast<int>(h() * h() / total));
    const double progress = m_dataManager.list().scrollOffset() / std::max(1.0, maxScrollOffset());
    const int thumbY = y() + static_cast<int>((h() - thumbH) * progress);

    fl_color(ThemeColors::BG_SECONDARY);
    fl_rectf(x() + w() - INDICATOR_WIDTH - 2, y(), INDICATOR_WIDTH, h());

    fl_color(ThemeColors::BRAND_PRIMARY);
    fl_rectf(x() + w() - INDICATOR_WIDTH - 2, thumbY, INDICATOR_WIDTH, thumbH);
}

double VirtualListView::maxScrollOffset() {
    return std::max(0.0, m_dataManager.list().getTotalSize() - h());
}

void VirtualListView::scrollBy(double delta) {
    const double current = m_dataManager.list().scrollOffset();
    m_dataManager.setScrollOffset(std::clamp(current + delta, 0.0, maxScrollOffset()));
}

int VirtualListView::handle(int event) {
    switch (event) {
    case FL_MOUSEWHEEL: {
        int dy = Fl::event_dy();
        if (dy != 0) {
            scrollBy(dy * SCROLL_STEP);
        }
        return 1;
    }

    case FL_FOCUS:
    case FL_UNFOCUS:
        return 1;

    case FL_PUSH:
        take_focus();
        return 1;

    case FL_KEYBOARD: {
        const int itemCount = m_dataManager.config().itemCount;
        switch (Fl::event_key()) {
        case FL_Home:
            if (itemCount > 0)
                m_dataManager.list().scrollToIndex(0, VirtualScroll::Align::Start);
            return 1;
        case FL_End:
            if (itemCount > 0)
                m_dataManager.list().scrollToIndex(itemCount - 1, VirtualScroll::Align::End);
            return 1;
        case FL_Page_Down:
            scrollBy(h());
            return 1;
        case FL_Page_Up:
            scrollBy(-h());
            return 1;
        case FL_Down:
            scrollBy(SCROLL_STEP);
            return 1;
        case FL_Up:
            scrollBy(-SCROLL_STEP);
            return 1;
        }
        break;
    }
    }

    return Fl_Group::handle(event);
}

void VirtualListView::resize(int x, int y, int w, int h) {
    Fl_Group::resize(x, y, w, h);
    m_dataManager.setViewport(w, h);
    Logger::log(Logger::Level::DEBUG, "VirtualList", "Viewport " + std::to_string(w) + "x" + std::to_string(h));
}
