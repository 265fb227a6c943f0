/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GITWORKTREEMANAGER_H
#define GITWORKTREEMANAGER_H

#include "devhavenprivate_export.h"

#include <QList>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

namespace DevHaven
{

/**
 * GitWorktreeManager runs the git commands behind worktree provisioning.
 *
 * Commands run asynchronously through QProcess and report back through
 * callbacks on the event loop. The operations are virtual so callers can be
 * tested against a scripted repository.
 */
class DEVHAVENPRIVATE_EXPORT GitWorktreeManager : public QObject
{
    Q_OBJECT

public:
    /**
     * A local branch
     */
    struct BranchInfo {
        QString name;
        bool isMain = false;
    };

    /**
     * One entry of `git worktree list --porcelain`
     */
    struct WorktreeInfo {
        QString path;
        QString branch; // Short name, empty when detached
        QString head;
        bool isMain = false;
        bool detached = false;
        bool prunable = false;
    };

    using BranchesCallback = std::function<void(bool ok, const QList<BranchInfo> &branches, const QString &error)>;
    using WorktreesCallback = std::function<void(bool ok, const QList<WorktreeInfo> &worktrees, const QString &error)>;
    using ResultCallback = std::function<void(bool ok, const QString &error)>;

    explicit GitWorktreeManager(QObject *parent = nullptr);
    ~GitWorktreeManager() override;

    void setGitExecutable(const QString &executable)
    {
        m_gitExecutable = executable;
    }
    QString gitExecutable() const
    {
        return m_gitExecutable;
    }

    /**
     * Check if git is available on the system
     */
    static bool isAvailable(const QString &executable = QStringLiteral("git"));

    /**
     * True when @p path has a .git entry (a directory, or a file for
     * worktrees and submodules)
     */
    virtual bool isGitRepository(const QString &path) const;

    /**
     * Local branches of @p repoPath. The default branch (origin/HEAD, else
     * main, else master) is flagged isMain.
     */
    virtual void listBranches(const QString &repoPath, BranchesCallback callback);

    /**
     * Worktrees of @p repoPath, the main checkout first
     */
    virtual void listWorktrees(const QString &repoPath, WorktreesCallback callback);

    /**
     * git worktree add. With @p createBranch a new branch is created from
     * @p baseBranch (or HEAD when empty); otherwise @p branch must exist.
     */
    virtual void addWorktree(const QString &repoPath,
                             const QString &worktreePath,
                             const QString &branch,
                             bool createBranch,
                             const QString &baseBranch,
                             ResultCallback callback);

    virtual void removeWorktree(const QString &repoPath, const QString &worktreePath, bool force, ResultCallback callback);

    /**
     * Parse `git branch --list` output
     */
    static QStringList parseBranchList(const QString &output);

    /**
     * Pick the default branch among @p branches given the target of
     * refs/remotes/origin/HEAD (may be empty)
     */
    static QString resolveDefaultBranch(const QStringList &branches, const QString &originHead);

    /**
     * Parse `git worktree list --porcelain` output
     */
    static QList<WorktreeInfo> parseWorktreeList(const QString &output);

    /**
     * Loose check of a branch name against git's ref naming rules
     */
    static bool isValidBranchName(const QString &name);

Q_SIGNALS:
    /**
     * Emitted when a git command fails
     */
    void errorOccurred(const QString &message);

protected:
    /**
     * Run git in @p workingDir. The callback gets the exit status, stdout and
     * stderr (or the start error).
     */
    void executeCommandAsync(const QString &workingDir,
                             const QStringList &args,
                             std::function<void(bool ok, const QString &output, const QString &errorOutput)> callback);

private:
    QString m_gitExecutable = QStringLiteral("git");
    static constexpr int COMMAND_TIMEOUT_MS = 120000;
};

} // namespace DevHaven

#endif // GITWORKTREEMANAGER_H
