#pragma once

#include "Config.hpp"

#include <optional>
#include <vector>

// selected[category][package] for the update step, plus the list cursor.
// Required packages are always selected.
class CPackageSelection {
  public:
    explicit CPackageSelection(const std::vector<SUpdateCategory>& categories);

    bool                        isSelected(size_t category, size_t package) const;
    void                        toggleCategory(size_t category);
    void                        togglePackage(size_t category, size_t package);

    bool                        isCategoryFullySelected(size_t category) const;
    bool                        isCategoryPartiallySelected(size_t category) const;
    bool                        isCategoryAnySelected(size_t category) const;
    bool                        anySelected() const;

    // commands of every selected package in declaration order
    std::vector<SCommandConfig> selectedCommands() const;
    bool                        needsSudo() const;

    // cursor: a category header (no package) or a package inside it
    size_t                      cursorCategory() const;
    std::optional<size_t>       cursorPackage() const;
    void                        moveDown();
    void                        moveUp();
    void                        toggleAtCursor();

    const std::vector<SUpdateCategory>& categories() const;

  private:
    std::vector<SUpdateCategory>   m_categories;
    std::vector<std::vector<bool>> m_selected;

    size_t                         m_cursorCategory = 0;
    std::optional<size_t>          m_cursorPackage;
};
