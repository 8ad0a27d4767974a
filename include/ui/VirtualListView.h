#pragma once

#include <FL/Fl_Group.H>

#include <string>
#include <vector>

#include "state/VirtualListDataManager.h"

/**
 * FLTK surface for a vertical virtual list of text rows.
 *
 * Only the rows in the latest render list are drawn; sticky rows are pinned
 * to the top edge above the others.
 */
class VirtualListView : public Fl_Group {
  public:
    VirtualListView(int x, int y, int w, int h, ListConfig config, std::vector<std::string> rows);
    ~VirtualListView();

    void draw() override;
    int handle(int event) override;
    void resize(int x, int y, int w, int h) override;

    VirtualListDataManager<std::string> &dataManager() { return m_dataManager; }

  private:
    void drawRow(const RenderItem<std::string> &row, int rowY, int rowH);
    void drawScrollIndicator();
    void scrollBy(double delta);
    double maxScrollOffset();

    VirtualListDataManager<std::string> m_dataManager;
    std::vector<RenderItem<std::string>> m_rows;
    VirtualListDataManager<std::string>::ListenerId m_listenerId = 0;

    static constexpr int SCROLL_STEP = 40;
    static constexpr int ROW_PADDING = 12;
    static constexpr int INDICATOR_WIDTH = 4;
};
