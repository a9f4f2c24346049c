#ifndef PANELSTATE_H
#define PANELSTATE_H

#include <QList>
#include <QString>

#include "services/fileentry.h"

enum class PanelSide { Local, Remote };

/**
 * @brief Listing shown on one side of the browser, with its cursor.
 *
 * selectedIndex is kept inside [0, entries.size()) after every mutation,
 * or -1 when there are no entries.
 */
struct PanelState {
    QString cwd;
    QList<FileEntry> entries;      ///< What is displayed (possibly filtered)
    QList<FileEntry> unfiltered;   ///< Full listing of cwd, ".." included
    int selectedIndex = -1;

    /// @brief Replaces the listing, clears any filter and selects the first entry.
    void setListing(const QString &directory, const QList<FileEntry> &listing)
    {
        cwd = directory;
        unfiltered = listing;
        entries = listing;
        selectedIndex = 0;
        clampSelection();
    }

    /// @brief Shows only entries whose name contains @p text (case-insensitive); ".." stays.
    void applyFilter(const QString &text)
    {
        entries.clear();
        for (const FileEntry &entry : unfiltered) {
            if (entry.isParentLink() || text.isEmpty()
                || entry.name.contains(text, Qt::CaseInsensitive)) {
                entries.append(entry);
            }
        }
        selectedIndex = 0;
        clampSelection();
    }

    /// @brief Drops any filter and selects the first entry.
    void clearFilter()
    {
        entries = unfiltered;
        selectedIndex = 0;
        clampSelection();
    }

    void moveSelection(int delta)
    {
        if (entries.isEmpty()) {
            selectedIndex = -1;
            return;
        }
        selectedIndex = qBound(0, selectedIndex + delta, static_cast<int>(entries.size()) - 1);
    }

    void clampSelection()
    {
        if (entries.isEmpty()) {
            selectedIndex = -1;
        } else {
            selectedIndex = qBound(0, selectedIndex, static_cast<int>(entries.size()) - 1);
        }
    }

    [[nodiscard]] const FileEntry *selectedEntry() const
    {
        if (selectedIndex < 0 || selectedIndex >= entries.size()) {
            return nullptr;
        }
        return &entries.at(selectedIndex);
    }
};

#endif // PANELSTATE_H
