#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace gitscribe {

/**
 * @brief Closed set of failure causes recognizable in git's output
 *
 * The GitHub-specific kinds come from server-side hooks (GH00x codes)
 * relayed on stderr as "remote: error: ..." lines.
 */
enum class GitErrorKind {
    SSHKeyAuditUnverified,
    SSHAuthenticationFailed,
    SSHPermissionDenied,
    HTTPSAuthenticationFailed,
    RemoteDisconnection,
    HostDown,
    RebaseConflicts,
    MergeConflicts,
    HTTPSRepositoryNotFound,
    SSHRepositoryNotFound,
    PushNotFastForward,
    BranchDeletionFailed,
    DefaultBranchDeletionFailed,
    RevertConflicts,
    EmptyRebasePatch,
    NoMatchingRemoteBranch,
    NoExistingRemoteBranch,
    NothingToCommit,
    NoSubmoduleMapping,
    SubmoduleRepositoryDoesNotExist,
    InvalidSubmoduleSHA,
    LocalPermissionDenied,
    InvalidMerge,
    InvalidRebase,
    NonFastForwardMergeIntoEmptyHead,
    PatchDoesNotApply,
    BranchAlreadyExists,
    BadRevision,
    NotAGitRepository,
    CannotMergeUnrelatedHistories,
    LFSAttributeDoesNotMatch,
    BranchRenameFailed,
    PathDoesNotExist,
    InvalidObjectName,
    OutsideRepository,
    LockFileAlreadyExists,
    NoMergeToAbort,
    LocalChangesOverwritten,
    UnresolvedConflicts,
    GPGFailedToSignData,
    ConflictModifyDeletedInBranch,
    // GitHub-specific
    PushWithFileSizeExceedingLimit,
    HexBranchNameRejected,
    ForcePushRejected,
    InvalidRefLength,
    ProtectedBranchRequiresReview,
    ProtectedBranchForcePush,
    ProtectedBranchDeleteRejected,
    ProtectedBranchRequiredStatus,
    PushWithPrivateEmail,
    // End of GitHub-specific
    ConfigLockFileAlreadyExists,
    RemoteAlreadyExists,
    TagAlreadyExists,
    MergeWithLocalChanges,
    RebaseWithLocalChanges,
    MergeCommitNoMainlineOption,
    UnsafeDirectory,
    PathExistsButNotInRef
};

/// Enumerator name, e.g. "HostDown".
const char* toString(GitErrorKind kind);

/**
 * @brief User-facing explanation of an error kind
 *
 * @return Message, or std::nullopt for kinds that are detected but left
 *         without a synthesized message (callers supply their own copy)
 */
std::optional<std::string> describe(GitErrorKind kind);

/// One row of the classification table.
struct ErrorRule {
    std::string pattern;   // ECMAScript regex, searched anywhere in the text
    GitErrorKind kind;
    // When set, this literal must also occur earlier in the text, ending at
    // least one character before the match. Keeps an unbounded "prefix, then
    // anything, then pattern" rule out of the regex engine.
    std::string precededBy{};
};

/**
 * @brief Ordered (pattern, kind) table and the classifier over it
 *
 * Rules are evaluated top to bottom and the first match wins, so a more
 * specific pattern must precede any broader one that also matches its text
 * (e.g. "Authentication failed for 'https://" before "Authentication failed").
 * Patterns are compiled once, on first use of instance().
 */
class ErrorTaxonomy {
public:
    static const ErrorTaxonomy& instance();

    /// Kind of the first rule matching text; nullopt when nothing matches.
    std::optional<GitErrorKind> classify(const std::string& text) const;

    /// Classify stderr, falling back to stdout when stderr is empty or unmatched.
    std::optional<GitErrorKind> classify(const std::string& stderrText, const std::string& stdoutText) const;

    /**
     * @brief Files named in a "file exceeds size limit" push rejection
     *
     * Extracts the text between each "remote: error: File " (at a line
     * start) and "; this exceeds GitHub's file size limit of 100.00 MB".
     *
     * @return "<file> (<size>)" per rejected file; empty when the begin and
     *         end marker counts differ
     */
    std::vector<std::string> oversizedFiles(const std::string& text) const;

    /**
     * @brief Description of kind, extended with the offending files for
     *        PushWithFileSizeExceedingLimit when they can be extracted
     */
    std::optional<std::string> failureMessage(GitErrorKind kind, const std::string& text) const;

    const std::vector<ErrorRule>& rules() const { return ruleTable; }

private:
    ErrorTaxonomy();

    std::vector<ErrorRule> ruleTable;
    std::vector<std::regex> compiled;  // parallel to ruleTable
};

}
