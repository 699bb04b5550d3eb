#include "Packages.hpp"

#include <algorithm>

CPackageSelection::CPackageSelection(const std::vector<SUpdateCategory>& categories) : m_categories(categories) {
    for (const auto& c : m_categories) {
        auto& row = m_selected.emplace_back();
        for (const auto& p : c.packages) {
            row.emplace_back(p.defaultEnabled(c.enabledByDefault));
        }
    }
}

bool CPackageSelection::isSelected(size_t category, size_t package) const {
    if (category >= m_selected.size() || package >= m_selected[category].size())
        return false;
    return m_selected[category][package];
}

void CPackageSelection::toggleCategory(size_t category) {
    if (category >= m_selected.size())
        return;

    auto&      row       = m_selected[category];
    const bool NEW_VALUE = !std::ranges::all_of(row, [](bool b) { return b; });

    for (size_t i = 0; i < row.size(); ++i) {
        row[i] = m_categories[category].packages[i].required ? true : NEW_VALUE;
    }
}

void CPackageSelection::togglePackage(size_t category, size_t package) {
    if (category >= m_selected.size() || package >= m_selected[category].size())
        return;

    if (m_categories[category].packages[package].required)
        return;

    m_selected[category][package] = !m_selected[category][package];
}

bool CPackageSelection::isCategoryFullySelected(size_t category) const {
    if (category >= m_selected.size() || m_selected[category].empty())
        return false;
    return std::ranges::all_of(m_selected[category], [](bool b) { return b; });
}

bool CPackageSelection::isCategoryPartiallySelected(size_t category) const {
    return isCategoryAnySelected(category) && !isCategoryFullySelected(category);
}

bool CPackageSelection::isCategoryAnySelected(size_t category) const {
    if (category >= m_selected.size())
        return false;
    return std::ranges::any_of(m_selected[category], [](bool b) { return b; });
}

bool CPackageSelection::anySelected() const {
    for (size_t i = 0; i < m_selected.size(); ++i) {
        if (isCategoryAnySelected(i))
            return true;
    }
    return false;
}

std::vector<SCommandConfig> CPackageSelection::selectedCommands() const {
    std::vector<SCommandConfig> out;
    for (size_t c = 0; c < m_categories.size(); ++c) {
        for (size_t p = 0; p < m_categories[c].packages.size(); ++p) {
            if (!m_selected[c][p])
                continue;

            const auto& cmds = m_categories[c].packages[p].commands;
            out.insert(out.end(), cmds.begin(), cmds.end());
        }
    }
    return out;
}

bool CPackageSelection::needsSudo() const {
    return std::ranges::any_of(selectedCommands(), [](const auto& c) { return c.sudo; });
}

size_t CPackageSelection::cursorCategory() const {
    return m_cursorCategory;
}

std::optional<size_t> CPackageSelection::cursorPackage() const {
    return m_cursorPackage;
}

void CPackageSelection::moveDown() {
    if (m_categories.empty())
        return;

    const auto& cat  = m_categories[m_cursorCategory];
    const bool  LAST = m_cursorCategory + 1 >= m_categories.size();

    if (!m_cursorPackage) {
        if (!cat.packages.empty())
            m_cursorPackage = 0;
        else if (!LAST)
            m_cursorCategory++;
        return;
    }

    if (*m_cursorPackage + 1 < cat.packages.size())
        m_cursorPackage = *m_cursorPackage + 1;
    else if (!LAST) {
        m_cursorCategory++;
        m_cursorPackage.reset();
    }
}

void CPackageSelection::moveUp() {
    if (m_categories.empty())
        return;

    if (m_cursorPackage) {
        if (*m_cursorPackage > 0)
            m_cursorPackage = *m_cursorPackage - 1;
        else
            m_cursorPackage.reset();
        return;
    }

    if (m_cursorCategory == 0)
        return;

    m_cursorCategory--;
    const auto& prev = m_categories[m_cursorCategory];
    if (!prev.packages.empty())
        m_cursorPackage = prev.packages.size() - 1;
}

void CPackageSelection::toggleAtCursor() {
    if (m_cursorPackage)
        togglePackage(m_cursorCategory, *m_cursorPackage);
    else
        toggleCategory(m_cursorCategory);
}

const std::vector<SUpdateCategory>& CPackageSelection::categories() const {
    return m_categories;
}
