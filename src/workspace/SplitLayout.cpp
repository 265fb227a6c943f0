/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SplitLayout.h"

#include <QJsonArray>
#include <QtMath>

#include <cmath>

namespace DevHaven
{

namespace
{

constexpr double RatioTolerance = 1e-6;

bool insertsBefore(SplitDirection direction)
{
    return direction == SplitDirection::Left || direction == SplitDirection::Up;
}

SplitNode createSplit(const SplitNode &primary, const SplitNode &secondary, SplitDirection direction)
{
    std::vector<SplitNode> children;
    if (insertsBefore(direction)) {
        children = {secondary, primary};
    } else {
        children = {primary, secondary};
    }
    return SplitNode::split(SplitLayout::orientationFor(direction), children, {0.5, 0.5});
}

SplitNode replaceAtPath(const SplitNode &root, const QList<int> &path, int depth, const SplitNode &replacement)
{
    if (depth == path.size()) {
        return replacement;
    }
    if (!root.isSplit()) {
        return root;
    }
    const int index = path.at(depth);
    if (index < 0 || index >= static_cast<int>(root.children.size())) {
        return root;
    }

    SplitNode next = root;
    next.children[index] = replaceAtPath(root.children[index], path, depth + 1, replacement);
    next.ratios = SplitLayout::normalizeRatios(root.ratios, static_cast<int>(next.children.size()));
    return next;
}

void collectInto(const SplitNode &node, QStringList &ids)
{
    if (node.isPane()) {
        ids.append(node.sessionId);
        return;
    }
    for (const SplitNode &child : node.children) {
        collectInto(child, ids);
    }
}

bool findPathInto(const SplitNode &node, const QString &sessionId, QList<int> &path)
{
    if (node.isPane()) {
        return node.sessionId == sessionId;
    }
    for (int i = 0; i < static_cast<int>(node.children.size()); ++i) {
        path.append(i);
        if (findPathInto(node.children[i], sessionId, path)) {
            return true;
        }
        path.removeLast();
    }
    return false;
}

// Returns the node unchanged when the session is not below it, an invalid
// node when the whole subtree went away.
SplitNode removeFromNode(const SplitNode &node, const QString &sessionId, bool *changed)
{
    if (node.isPane()) {
        if (node.sessionId == sessionId) {
            *changed = true;
            return SplitNode();
        }
        return node;
    }
    if (!node.isSplit()) {
        return node;
    }

    const int count = static_cast<int>(node.children.size());
    const QList<double> ratios = SplitLayout::normalizeRatios(node.ratios, count);

    std::vector<SplitNode> nextChildren;
    QList<double> nextRatios;
    bool subtreeChanged = false;
    // Share of removed leading children, handed to the first survivor.
    double carry = 0.0;

    for (int i = 0; i < count; ++i) {
        bool childChanged = false;
        SplitNode nextChild = removeFromNode(node.children[i], sessionId, &childChanged);
        subtreeChanged = subtreeChanged || childChanged;

        if (!nextChild.isValid()) {
            if (!nextRatios.isEmpty()) {
                nextRatios.last() += ratios.at(i);
            } else {
                carry += ratios.at(i);
            }
            continue;
        }
        nextChildren.push_back(nextChild);
        nextRatios.append(ratios.at(i) + carry);
        carry = 0.0;
    }

    if (!subtreeChanged) {
        return node;
    }
    *changed = true;

    if (nextChildren.empty()) {
        return SplitNode();
    }
    if (nextChildren.size() == 1) {
        return nextChildren.front();
    }

    SplitNode next = node;
    next.children = nextChildren;
    next.ratios = SplitLayout::normalizeRatios(nextRatios, static_cast<int>(nextChildren.size()));
    return next;
}

} // namespace

SplitNode SplitNode::pane(const QString &sessionId)
{
    SplitNode node;
    node.type = Type::Pane;
    node.sessionId = sessionId;
    return node;
}

SplitNode SplitNode::split(Orientation orientation, const std::vector<SplitNode> &children, const QList<double> &ratios)
{
    SplitNode node;
    node.type = Type::Split;
    node.orientation = orientation;
    node.children = children;
    node.ratios = ratios;
    return node;
}

QJsonObject SplitNode::toJson() const
{
    QJsonObject obj;
    switch (type) {
    case Type::Pane:
        obj[QStringLiteral("type")] = QStringLiteral("pane");
        obj[QStringLiteral("sessionId")] = sessionId;
        break;
    case Type::Split: {
        obj[QStringLiteral("type")] = QStringLiteral("split");
        obj[QStringLiteral("orientation")] = orientation == Orientation::Horizontal ? QStringLiteral("h") : QStringLiteral("v");
        QJsonArray childArray;
        for (const SplitNode &child : children) {
            childArray.append(child.toJson());
        }
        obj[QStringLiteral("children")] = childArray;
        QJsonArray ratioArray;
        for (double ratio : ratios) {
            ratioArray.append(ratio);
        }
        obj[QStringLiteral("ratios")] = ratioArray;
        break;
    }
    case Type::Invalid:
        break;
    }
    return obj;
}

SplitNode SplitNode::fromJson(const QJsonObject &obj)
{
    const QString typeName = obj.value(QStringLiteral("type")).toString();

    // Older files stored bare panes without a type.
    if (typeName == QLatin1String("pane") || (typeName.isEmpty() && obj.contains(QStringLiteral("sessionId")))) {
        const QString id = obj.value(QStringLiteral("sessionId")).toString();
        return id.isEmpty() ? SplitNode() : SplitNode::pane(id);
    }

    if (typeName != QLatin1String("split")) {
        return SplitNode();
    }

    SplitNode node;
    node.type = Type::Split;
    const QString orientationName = obj.value(QStringLiteral("orientation")).toString();
    node.orientation = orientationName == QLatin1String("v") ? Orientation::Vertical : Orientation::Horizontal;

    const QJsonArray childArray = obj.value(QStringLiteral("children")).toArray();
    for (const QJsonValue &value : childArray) {
        node.children.push_back(value.isObject() ? SplitNode::fromJson(value.toObject()) : SplitNode());
    }
    const QJsonArray ratioArray = obj.value(QStringLiteral("ratios")).toArray();
    for (const QJsonValue &value : ratioArray) {
        node.ratios.append(value.toDouble(0.0));
    }
    return node;
}

QString SplitNode::toString() const
{
    switch (type) {
    case Type::Pane:
        return sessionId;
    case Type::Split: {
        QStringList parts;
        for (int i = 0; i < static_cast<int>(children.size()); ++i) {
            const double ratio = i < ratios.size() ? ratios.at(i) : 0.0;
            parts.append(QStringLiteral("%1:%2").arg(children[i].toString()).arg(ratio, 0, 'f', 2));
        }
        const QLatin1Char axis(orientation == Orientation::Horizontal ? 'h' : 'v');
        return QStringLiteral("%1[%2]").arg(axis).arg(parts.join(QLatin1Char(',')));
    }
    case Type::Invalid:
        break;
    }
    return QStringLiteral("<invalid>");
}

bool SplitNode::operator==(const SplitNode &other) const
{
    if (type != other.type) {
        return false;
    }
    if (type == Type::Pane) {
        return sessionId == other.sessionId;
    }
    if (type == Type::Invalid) {
        return true;
    }
    if (orientation != other.orientation || children.size() != other.children.size() || ratios.size() != other.ratios.size()) {
        return false;
    }
    for (int i = 0; i < ratios.size(); ++i) {
        if (qAbs(ratios.at(i) - other.ratios.at(i)) > RatioTolerance) {
            return false;
        }
    }
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i] != other.children[i]) {
            return false;
        }
    }
    return true;
}

namespace SplitLayout
{

SplitNode::Orientation orientationFor(SplitDirection direction)
{
    return (direction == SplitDirection::Left || direction == SplitDirection::Right) ? SplitNode::Orientation::Horizontal
                                                                                   : SplitNode::Orientation::Vertical;
}

SplitNode splitPane(const SplitNode &root, const QString &targetSessionId, SplitDirection direction, const QString &newSessionId)
{
    const std::optional<QList<int>> targetPath = findPanePath(root, targetSessionId);
    if (!targetPath) {
        return root;
    }

    const SplitNode newPane = SplitNode::pane(newSessionId);
    if (targetPath->isEmpty()) {
        return createSplit(root, newPane, direction);
    }

    const QList<int> parentPath = targetPath->mid(0, targetPath->size() - 1);
    const int targetIndex = targetPath->last();
    const SplitNode *parent = nodeAtPath(root, parentPath);
    if (!parent || !parent->isSplit()) {
        return root;
    }

    if (parent->orientation == orientationFor(direction)) {
        const int count = static_cast<int>(parent->children.size());
        QList<double> ratios = normalizeRatios(parent->ratios, count);
        const double half = ratios.at(targetIndex) / 2.0;
        const int insertIndex = insertsBefore(direction) ? targetIndex : targetIndex + 1;

        SplitNode updated = *parent;
        updated.children.insert(updated.children.begin() + insertIndex, newPane);
        ratios[targetIndex] = half;
        ratios.insert(insertIndex, half);
        // Halving may push the target below the minimum share
        updated.ratios = clampRatios(normalizeRatios(ratios, count + 1));
        return replaceAtPath(root, parentPath, 0, updated);
    }

    const SplitNode *target = nodeAtPath(root, *targetPath);
    return replaceAtPath(root, *targetPath, 0, createSplit(*target, newPane, direction));
}

SplitNode removePane(const SplitNode &root, const QString &sessionId)
{
    bool changed = false;
    return removeFromNode(root, sessionId, &changed);
}

SplitNode updateSplitRatios(const SplitNode &root, const QList<int> &path, const QList<double> &ratios)
{
    const SplitNode *node = nodeAtPath(root, path);
    if (!node || !node->isSplit()) {
        return root;
    }

    const int count = static_cast<int>(node->children.size());
    const QList<double> current = normalizeRatios(node->ratios, count);

    SplitNode updated = *node;

    if (ratios.size() == count) {
        QList<int> changed;
        for (int i = 0; i < count; ++i) {
            if (qAbs(ratios.at(i) - current.at(i)) > 1e-9) {
                changed.append(i);
            }
        }
        if (changed.isEmpty()) {
            return root;
        }

        int lead = -1;
        int partner = -1;
        if (changed.size() == 1 && count > 1) {
            lead = changed.first();
            partner = lead + 1 < count ? lead + 1 : lead - 1;
        } else if (changed.size() == 2 && changed.at(1) == changed.at(0) + 1) {
            lead = changed.at(0);
            partner = changed.at(1);
        }

        if (lead >= 0) {
            const double total = current.at(lead) + current.at(partner);
            double value = std::isfinite(ratios.at(lead)) ? ratios.at(lead) : current.at(lead);
            if (total >= 2 * MinRatio) {
                value = qBound(MinRatio, value, total - MinRatio);
            } else {
                value = total / 2.0;
            }
            QList<double> next = current;
            next[lead] = value;
            next[partner] = total - value;
            updated.ratios = next;
            return replaceAtPath(root, path, 0, updated);
        }
    }

    updated.ratios = clampRatios(normalizeRatios(ratios, count));
    return replaceAtPath(root, path, 0, updated);
}

SplitNode dragDivider(const SplitNode &root, const QList<int> &path, int dividerIndex, double delta)
{
    const SplitNode *node = nodeAtPath(root, path);
    if (!node || !node->isSplit()) {
        return root;
    }
    const int count = static_cast<int>(node->children.size());
    if (dividerIndex < 0 || dividerIndex + 1 >= count) {
        return root;
    }

    QList<double> ratios = normalizeRatios(node->ratios, count);
    ratios[dividerIndex] += delta;
    ratios[dividerIndex + 1] -= delta;
    return updateSplitRatios(root, path, ratios);
}

QStringList collectSessionIds(const SplitNode &root)
{
    QStringList ids;
    collectInto(root, ids);
    return ids;
}

QSet<QString> orphanedSessionIds(const SplitNode &before, const SplitNode &after)
{
    const QStringList beforeIds = collectSessionIds(before);
    const QStringList afterIds = collectSessionIds(after);
    QSet<QString> orphans(beforeIds.begin(), beforeIds.end());
    for (const QString &id : afterIds) {
        orphans.remove(id);
    }
    return orphans;
}

std::optional<QList<int>> findPanePath(const SplitNode &root, const QString &sessionId)
{
    QList<int> path;
    if (findPathInto(root, sessionId, path)) {
        return path;
    }
    return std::nullopt;
}

const SplitNode *nodeAtPath(const SplitNode &root, const QList<int> &path)
{
    const SplitNode *current = &root;
    for (int index : path) {
        if (!current->isSplit() || index < 0 || index >= static_cast<int>(current->children.size())) {
            return nullptr;
        }
        current = &current->children[index];
    }
    return current;
}

SplitNode normalizeNode(const SplitNode &node)
{
    if (node.isPane()) {
        return node.sessionId.isEmpty() ? SplitNode() : node;
    }
    if (!node.isSplit()) {
        return SplitNode();
    }

    const int count = static_cast<int>(node.children.size());
    std::vector<SplitNode> children;
    QList<double> ratios;
    for (int i = 0; i < count; ++i) {
        SplitNode child = normalizeNode(node.children[i]);
        if (!child.isValid()) {
            continue;
        }
        children.push_back(child);
        ratios.append(i < node.ratios.size() ? node.ratios.at(i) : 1.0 / count);
    }

    if (children.empty()) {
        return SplitNode();
    }
    if (children.size() == 1) {
        return children.front();
    }

    SplitNode next = node;
    next.children = children;
    next.ratios = clampRatios(normalizeRatios(ratios, static_cast<int>(children.size())));
    return next;
}

QList<double> normalizeRatios(const QList<double> &ratios, int count)
{
    if (count <= 0) {
        return {};
    }

    QList<double> next = ratios.mid(0, count);
    while (next.size() < count) {
        next.append(1.0 / count);
    }

    double sum = 0.0;
    for (double &value : next) {
        if (!std::isfinite(value) || value < 0.0) {
            value = 0.0;
        }
        sum += value;
    }

    if (sum <= 0.0) {
        return QList<double>(count, 1.0 / count);
    }
    for (double &value : next) {
        value /= sum;
    }
    return next;
}

QList<double> clampRatios(const QList<double> &ratios)
{
    const int count = ratios.size();
    if (count == 0) {
        return {};
    }
    if (count * MinRatio >= 1.0) {
        return QList<double>(count, 1.0 / count);
    }

    QList<double> result = normalizeRatios(ratios, count);
    QList<bool> pinned(count, false);

    // Each pass pins at least one more entry to MinRatio, so this terminates.
    bool changed = true;
    while (changed) {
        changed = false;
        double freeTotal = 0.0;
        int pinnedCount = 0;
        int freeCount = 0;
        for (int i = 0; i < count; ++i) {
            if (pinned.at(i)) {
                ++pinnedCount;
            } else {
                freeTotal += result.at(i);
                ++freeCount;
            }
        }
        const double available = 1.0 - pinnedCount * MinRatio;
        for (int i = 0; i < count; ++i) {
            if (pinned.at(i)) {
                result[i] = MinRatio;
                continue;
            }
            result[i] = freeTotal > 0.0 ? result.at(i) * available / freeTotal : available / freeCount;
            if (result.at(i) < MinRatio - 1e-12) {
                pinned[i] = true;
                result[i] = MinRatio;
                changed = true;
            }
        }
    }
    return result;
}

} // namespace SplitLayout

} // namespace DevHaven
