/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SPLITLAYOUT_H
#define SPLITLAYOUT_H

#include "devhavenprivate_export.h"

#include <QJsonObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace DevHaven
{

/**
 * SplitNode is one node of a tab's pane layout.
 *
 * A node is either a Pane leaf, which only references a session id, or a
 * Split holding two or more children laid out along one axis with a parallel
 * list of size ratios. Nodes are plain values: every layout operation builds
 * and returns a new tree and never modifies its input.
 *
 * A default-constructed node is invalid. removePane() returns an invalid node
 * when the last leaf of a tree goes away, and fromJson() returns one for data
 * it cannot understand.
 */
class DEVHAVENPRIVATE_EXPORT SplitNode
{
public:
    enum class Type {
        Invalid,
        Pane,
        Split
    };

    /**
     * Horizontal lays children side by side, Vertical stacks them.
     */
    enum class Orientation {
        Horizontal,
        Vertical
    };

    SplitNode() = default;

    static SplitNode pane(const QString &sessionId);
    static SplitNode split(Orientation orientation, const std::vector<SplitNode> &children, const QList<double> &ratios);

    Type type = Type::Invalid;

    // Pane
    QString sessionId;

    // Split
    Orientation orientation = Orientation::Horizontal;
    std::vector<SplitNode> children;
    QList<double> ratios;

    bool isValid() const
    {
        return type != Type::Invalid;
    }
    bool isPane() const
    {
        return type == Type::Pane;
    }
    bool isSplit() const
    {
        return type == Type::Split;
    }

    QJsonObject toJson() const;
    static SplitNode fromJson(const QJsonObject &obj);

    /**
     * Compact textual form, e.g. "h[A:0.50,B:0.50]". Used in logs and test failures.
     */
    QString toString() const;

    /**
     * Structural equality; ratios compare with a small tolerance.
     */
    bool operator==(const SplitNode &other) const;
    bool operator!=(const SplitNode &other) const
    {
        return !(*this == other);
    }
};

/**
 * Where a new pane goes relative to the pane being split.
 */
enum class SplitDirection {
    Left,
    Right,
    Up,
    Down
};

/**
 * Pure transforms over SplitNode trees. None of these functions perform I/O
 * and all of them are deterministic.
 */
namespace SplitLayout
{

constexpr double MinRatio = 0.05;

DEVHAVENPRIVATE_EXPORT SplitNode::Orientation orientationFor(SplitDirection direction);

/**
 * Replace the leaf holding @p targetSessionId by a split of the old leaf and a
 * new leaf for @p newSessionId. When the leaf's parent already runs along the
 * requested axis, the new leaf becomes an extra sibling and takes half of the
 * target's share instead of nesting a new split.
 *
 * Returns @p root unchanged if the target is not in the tree.
 */
DEVHAVENPRIVATE_EXPORT SplitNode splitPane(const SplitNode &root, const QString &targetSessionId, SplitDirection direction, const QString &newSessionId);

/**
 * Remove the leaf holding @p sessionId. Splits left with a single child are
 * replaced by that child. The removed child's share goes to its preceding
 * sibling (or the following one when it was first).
 *
 * Returns an invalid node when the removed leaf was the whole tree.
 */
DEVHAVENPRIVATE_EXPORT SplitNode removePane(const SplitNode &root, const QString &sessionId);

/**
 * Replace the ratios of the split at @p path (child indices from the root).
 *
 * When exactly one adjacent pair differs from the current ratios the change is
 * treated as a divider drag: the first of the pair is clamped to
 * [MinRatio, pairTotal - MinRatio] and the second takes the rest, so the pair
 * keeps its total. Any other change clamps every ratio to
 * [MinRatio, 1 - MinRatio] and renormalizes the list.
 */
DEVHAVENPRIVATE_EXPORT SplitNode updateSplitRatios(const SplitNode &root, const QList<int> &path, const QList<double> &ratios);

/**
 * Move divider @p dividerIndex (between child i and i + 1) of the split at
 * @p path by @p delta.
 */
DEVHAVENPRIVATE_EXPORT SplitNode dragDivider(const SplitNode &root, const QList<int> &path, int dividerIndex, double delta);

/**
 * Session ids of all leaves, in layout order.
 */
DEVHAVENPRIVATE_EXPORT QStringList collectSessionIds(const SplitNode &root);

/**
 * Session ids present in @p before but gone from @p after.
 */
DEVHAVENPRIVATE_EXPORT QSet<QString> orphanedSessionIds(const SplitNode &before, const SplitNode &after);

DEVHAVENPRIVATE_EXPORT std::optional<QList<int>> findPanePath(const SplitNode &root, const QString &sessionId);
DEVHAVENPRIVATE_EXPORT const SplitNode *nodeAtPath(const SplitNode &root, const QList<int> &path);

/**
 * Repair a tree read from storage: drop invalid children, collapse splits with
 * a single child, fix ratio lists. Returns an invalid node if nothing usable
 * remains.
 */
DEVHAVENPRIVATE_EXPORT SplitNode normalizeNode(const SplitNode &node);

/**
 * Pad or truncate @p ratios to @p count entries and scale them to sum to 1.
 */
DEVHAVENPRIVATE_EXPORT QList<double> normalizeRatios(const QList<double> &ratios, int count);

/**
 * Scale @p ratios to sum to 1 with every entry at least MinRatio.
 */
DEVHAVENPRIVATE_EXPORT QList<double> clampRatios(const QList<double> &ratios);

} // namespace SplitLayout

} // namespace DevHaven

#endif // SPLITLAYOUT_H
