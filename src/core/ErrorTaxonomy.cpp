#include "core/ErrorTaxonomy.hpp"

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace gitscribe {

namespace {

/**
 * Rule order is significant: first match wins. Literal "\n" inside a
 * pattern is a newline that must appear in git's output at that point.
 */
std::vector<ErrorRule> buildRuleTable() {
    return {
        {"\\n+\\[EPOLICYKEYAGE\\]\\n+fatal: Could not read from remote repository.",
         GitErrorKind::SSHKeyAuditUnverified, "ERROR: "},
        {"fatal: Authentication failed for 'https://|The requested URL returned error: 403",
         GitErrorKind::HTTPSAuthenticationFailed},
        {"fatal: Authentication failed", GitErrorKind::SSHAuthenticationFailed},
        {"fatal: Could not read from remote repository.", GitErrorKind::SSHPermissionDenied},
        {"fatal: [Tt]he remote end hung up unexpectedly", GitErrorKind::RemoteDisconnection},
        {"fatal: unable to access '(.+)': Failed to connect to (.+): Host is down"
         "|Cloning into '(.+)'...\nfatal: unable to access '(.+)': Could not resolve host: (.+)",
         GitErrorKind::HostDown},
        {"Resolve all conflicts manually, mark them as resolved with", GitErrorKind::RebaseConflicts},
        {"(Merge conflict|Automatic merge failed; fix conflicts and then commit the result)",
         GitErrorKind::MergeConflicts},
        {"fatal: repository '(.+)' not found", GitErrorKind::HTTPSRepositoryNotFound},
        {"ERROR: Repository not found", GitErrorKind::SSHRepositoryNotFound},
        {"\\((non-fast-forward|fetch first)\\)\nerror: failed to push some refs to '.*'",
         GitErrorKind::PushNotFastForward},
        {"error: unable to delete '(.+)': remote ref does not exist", GitErrorKind::BranchDeletionFailed},
        {"\\[remote rejected\\] (.+) \\(deletion of the current branch prohibited\\)",
         GitErrorKind::DefaultBranchDeletionFailed},
        {"error: could not revert .*\nhint: after resolving the conflicts, mark the corrected paths\n"
         "hint: with 'git add <paths>' or 'git rm <paths>'\nhint: and commit the result with 'git commit'",
         GitErrorKind::RevertConflicts},
        {"Applying: .*\nNo changes - did you forget to use 'git add'\\?\n"
         "If there is nothing left to stage, chances are that something else\n.*",
         GitErrorKind::EmptyRebasePatch},
        {"There are no candidates for (rebasing|merging) among the refs that you just fetched.\n"
         "Generally this means that you provided a wildcard refspec which had no\nmatches on the remote end.",
         GitErrorKind::NoMatchingRemoteBranch},
        {"Your configuration specifies to merge with the ref '(.+)'\nfrom the remote, but no such ref was fetched.",
         GitErrorKind::NoExistingRemoteBranch},
        {"nothing to commit", GitErrorKind::NothingToCommit},
        {"[Nn]o submodule mapping found in .gitmodules for path '(.+)'", GitErrorKind::NoSubmoduleMapping},
        {"fatal: repository '(.+)' does not exist\nfatal: clone of '.+' into submodule path '(.+)' failed",
         GitErrorKind::SubmoduleRepositoryDoesNotExist},
        {"Fetched in submodule path '(.+)', but it did not contain (.+). Direct fetching of that commit failed.",
         GitErrorKind::InvalidSubmoduleSHA},
        {"fatal: could not create work tree dir '(.+)'.*: Permission denied", GitErrorKind::LocalPermissionDenied},
        {"merge: (.+) - not something we can merge", GitErrorKind::InvalidMerge},
        {"invalid upstream (.+)", GitErrorKind::InvalidRebase},
        {"fatal: Non-fast-forward commit does not make sense into an empty head",
         GitErrorKind::NonFastForwardMergeIntoEmptyHead},
        {"error: (.+): (patch does not apply|already exists in working directory)", GitErrorKind::PatchDoesNotApply},
        {"fatal: [Aa] branch named '(.+)' already exists.?", GitErrorKind::BranchAlreadyExists},
        {"fatal: bad revision '(.*)'", GitErrorKind::BadRevision},
        {"fatal: [Nn]ot a git repository \\(or any of the parent directories\\): (.*)",
         GitErrorKind::NotAGitRepository},
        {"fatal: refusing to merge unrelated histories", GitErrorKind::CannotMergeUnrelatedHistories},
        {"The .+ attribute should be .+ but is .+", GitErrorKind::LFSAttributeDoesNotMatch},
        {"fatal: Branch rename failed", GitErrorKind::BranchRenameFailed},
        {"fatal: path '(.+)' does not exist .+", GitErrorKind::PathDoesNotExist},
        {"fatal: invalid object name '(.+)'.", GitErrorKind::InvalidObjectName},
        {"fatal: .+: '(.+)' is outside repository", GitErrorKind::OutsideRepository},
        {"Another git process seems to be running in this repository, e.g.", GitErrorKind::LockFileAlreadyExists},
        {"fatal: There is no merge to abort", GitErrorKind::NoMergeToAbort},
        {"error: (?:Your local changes to the following|The following untracked working tree) files would be "
         "overwritten by checkout:",
         GitErrorKind::LocalChangesOverwritten},
        {"You must edit all merge conflicts and then\nmark them as resolved using git add"
         "|fatal: Exiting because of an unresolved conflict",
         GitErrorKind::UnresolvedConflicts},
        {"error: gpg failed to sign the data", GitErrorKind::GPGFailedToSignData},
        {"CONFLICT \\(modify/delete\\): (.+) deleted in (.+) and modified in (.+)",
         GitErrorKind::ConflictModifyDeletedInBranch},
        // GitHub-specific
        {"error: GH001: ", GitErrorKind::PushWithFileSizeExceedingLimit},
        {"error: GH002: ", GitErrorKind::HexBranchNameRejected},
        {"error: GH003: Sorry, force-pushing to (.+) is not allowed.", GitErrorKind::ForcePushRejected},
        {"error: GH005: Sorry, refs longer than (.+) bytes are not allowed", GitErrorKind::InvalidRefLength},
        {"error: GH006: Protected branch update failed for (.+)\nremote: error: At least one approved review is required",
         GitErrorKind::ProtectedBranchRequiresReview},
        {"error: GH006: Protected branch update failed for (.+)\nremote: error: Cannot force-push to a protected branch",
         GitErrorKind::ProtectedBranchForcePush},
        {"error: GH006: Protected branch update failed for (.+).\nremote: error: Cannot delete a protected branch",
         GitErrorKind::ProtectedBranchDeleteRejected},
        {"error: GH006: Protected branch update failed for (.+).\nremote: error: Required status check \"(.+)\" is expected",
         GitErrorKind::ProtectedBranchRequiredStatus},
        {"error: GH007: Your push would publish a private email address.", GitErrorKind::PushWithPrivateEmail},
        // End of GitHub-specific
        {"error: could not lock config file (.+): File exists", GitErrorKind::ConfigLockFileAlreadyExists},
        {"error: remote (.+) already exists.", GitErrorKind::RemoteAlreadyExists},
        {"fatal: tag '(.+)' already exists", GitErrorKind::TagAlreadyExists},
        {"error: Your local changes to the following files would be overwritten by merge:\n",
         GitErrorKind::MergeWithLocalChanges},
        {"error: cannot (pull with rebase|rebase): You have unstaged changes\\.\n\\s*error: [Pp]lease commit or stash them\\.",
         GitErrorKind::RebaseWithLocalChanges},
        {"error: commit (.+) is a merge but no -m option was given", GitErrorKind::MergeCommitNoMainlineOption},
        {"fatal: detected dubious ownership in repository at (.+)", GitErrorKind::UnsafeDirectory},
        {"fatal: path '(.+)' exists on disk, but not in '(.+)'", GitErrorKind::PathExistsButNotInRef},
    };
}

const char* const kAuthenticationFailed =
    "Authentication failed. Some common reasons include:\n\n"
    "- You are not signed in to your account.\n"
    "- Your credentials or token have expired and need to be refreshed.\n"
    "- You do not have permission to access this repository.\n"
    "- The repository is archived and no longer accepts pushes.\n"
    "- If you use SSH authentication, your key is not loaded in the ssh-agent or not associated with your account.";

}

const char* toString(GitErrorKind kind) {
    switch (kind) {
        case GitErrorKind::SSHKeyAuditUnverified: return "SSHKeyAuditUnverified";
        case GitErrorKind::SSHAuthenticationFailed: return "SSHAuthenticationFailed";
        case GitErrorKind::SSHPermissionDenied: return "SSHPermissionDenied";
        case GitErrorKind::HTTPSAuthenticationFailed: return "HTTPSAuthenticationFailed";
        case GitErrorKind::RemoteDisconnection: return "RemoteDisconnection";
        case GitErrorKind::HostDown: return "HostDown";
        case GitErrorKind::RebaseConflicts: return "RebaseConflicts";
        case GitErrorKind::MergeConflicts: return "MergeConflicts";
        case GitErrorKind::HTTPSRepositoryNotFound: return "HTTPSRepositoryNotFound";
        case GitErrorKind::SSHRepositoryNotFound: return "SSHRepositoryNotFound";
        case GitErrorKind::PushNotFastForward: return "PushNotFastForward";
        case GitErrorKind::BranchDeletionFailed: return "BranchDeletionFailed";
        case GitErrorKind::DefaultBranchDeletionFailed: return "DefaultBranchDeletionFailed";
        case GitErrorKind::RevertConflicts: return "RevertConflicts";
        case GitErrorKind::EmptyRebasePatch: return "EmptyRebasePatch";
        case GitErrorKind::NoMatchingRemoteBranch: return "NoMatchingRemoteBranch";
        case GitErrorKind::NoExistingRemoteBranch: return "NoExistingRemoteBranch";
        case GitErrorKind::NothingToCommit: return "NothingToCommit";
        case GitErrorKind::NoSubmoduleMapping: return "NoSubmoduleMapping";
        case GitErrorKind::SubmoduleRepositoryDoesNotExist: return "SubmoduleRepositoryDoesNotExist";
        case GitErrorKind::InvalidSubmoduleSHA: return "InvalidSubmoduleSHA";
        case GitErrorKind::LocalPermissionDenied: return "LocalPermissionDenied";
        case GitErrorKind::InvalidMerge: return "InvalidMerge";
        case GitErrorKind::InvalidRebase: return "InvalidRebase";
        case GitErrorKind::NonFastForwardMergeIntoEmptyHead: return "NonFastForwardMergeIntoEmptyHead";
        case GitErrorKind::PatchDoesNotApply: return "PatchDoesNotApply";
        case GitErrorKind::BranchAlreadyExists: return "BranchAlreadyExists";
        case GitErrorKind::BadRevision: return "BadRevision";
        case GitErrorKind::NotAGitRepository: return "NotAGitRepository";
        case GitErrorKind::CannotMergeUnrelatedHistories: return "CannotMergeUnrelatedHistories";
        case GitErrorKind::LFSAttributeDoesNotMatch: return "LFSAttributeDoesNotMatch";
        case GitErrorKind::BranchRenameFailed: return "BranchRenameFailed";
        case GitErrorKind::PathDoesNotExist: return "PathDoesNotExist";
        case GitErrorKind::InvalidObjectName: return "InvalidObjectName";
        case GitErrorKind::OutsideRepository: return "OutsideRepository";
        case GitErrorKind::LockFileAlreadyExists: return "LockFileAlreadyExists";
        case GitErrorKind::NoMergeToAbort: return "NoMergeToAbort";
        case GitErrorKind::LocalChangesOverwritten: return "LocalChangesOverwritten";
        case GitErrorKind::UnresolvedConflicts: return "UnresolvedConflicts";
        case GitErrorKind::GPGFailedToSignData: return "GPGFailedToSignData";
        case GitErrorKind::ConflictModifyDeletedInBranch: return "ConflictModifyDeletedInBranch";
        case GitErrorKind::PushWithFileSizeExceedingLimit: return "PushWithFileSizeExceedingLimit";
        case GitErrorKind::HexBranchNameRejected: return "HexBranchNameRejected";
        case GitErrorKind::ForcePushRejected: return "ForcePushRejected";
        case GitErrorKind::InvalidRefLength: return "InvalidRefLength";
        case GitErrorKind::ProtectedBranchRequiresReview: return "ProtectedBranchRequiresReview";
        case GitErrorKind::ProtectedBranchForcePush: return "ProtectedBranchForcePush";
        case GitErrorKind::ProtectedBranchDeleteRejected: return "ProtectedBranchDeleteRejected";
        case GitErrorKind::ProtectedBranchRequiredStatus: return "ProtectedBranchRequiredStatus";
        case GitErrorKind::PushWithPrivateEmail: return "PushWithPrivateEmail";
        case GitErrorKind::ConfigLockFileAlreadyExists: return "ConfigLockFileAlreadyExists";
        case GitErrorKind::RemoteAlreadyExists: return "RemoteAlreadyExists";
        case GitErrorKind::TagAlreadyExists: return "TagAlreadyExists";
        case GitErrorKind::MergeWithLocalChanges: return "MergeWithLocalChanges";
        case GitErrorKind::RebaseWithLocalChanges: return "RebaseWithLocalChanges";
        case GitErrorKind::MergeCommitNoMainlineOption: return "MergeCommitNoMainlineOption";
        case GitErrorKind::UnsafeDirectory: return "UnsafeDirectory";
        case GitErrorKind::PathExistsButNotInRef: return "PathExistsButNotInRef";
    }
    return "Unknown";
}

std::optional<std::string> describe(GitErrorKind kind) {
    switch (kind) {
        case GitErrorKind::SSHKeyAuditUnverified:
            return std::string("The SSH key is unverified.");
        case GitErrorKind::SSHAuthenticationFailed:
        case GitErrorKind::SSHPermissionDenied:
        case GitErrorKind::HTTPSAuthenticationFailed:
            return std::string(kAuthenticationFailed);
        case GitErrorKind::RemoteDisconnection:
            return std::string("The remote disconnected. Check your Internet connection and try again.");
        case GitErrorKind::HostDown:
            return std::string("The host is down. Check your Internet connection and try again.");
        case GitErrorKind::RebaseConflicts:
            return std::string("We found some conflicts while trying to rebase. Please resolve the conflicts before continuing.");
        case GitErrorKind::MergeConflicts:
            return std::string("We found some conflicts while trying to merge. Please resolve the conflicts and commit the changes.");
        case GitErrorKind::HTTPSRepositoryNotFound:
        case GitErrorKind::SSHRepositoryNotFound:
            return std::string("The repository does not seem to exist anymore. You may not have access, or it may have been deleted or renamed.");
        case GitErrorKind::PushNotFastForward:
            return std::string("The repository has been updated since you last pulled. Try pulling before pushing.");
        case GitErrorKind::BranchDeletionFailed:
            return std::string("Could not delete the branch. It was probably already deleted.");
        case GitErrorKind::DefaultBranchDeletionFailed:
            return std::string("The branch is the repository's default branch and cannot be deleted.");
        case GitErrorKind::RevertConflicts:
            return std::string("To finish reverting, please merge and commit the changes.");
        case GitErrorKind::EmptyRebasePatch:
            return std::string("There aren't any changes left to apply.");
        case GitErrorKind::NoMatchingRemoteBranch:
            return std::string("There aren't any remote branches that match the current branch.");
        case GitErrorKind::NoExistingRemoteBranch:
            return std::string("The remote branch does not exist.");
        case GitErrorKind::NothingToCommit:
            return std::string("There are no changes to commit.");
        case GitErrorKind::NoSubmoduleMapping:
            return std::string("A submodule was removed from .gitmodules, but the folder still exists in the repository. "
                               "Delete the folder, commit the change, then try again.");
        case GitErrorKind::SubmoduleRepositoryDoesNotExist:
            return std::string("A submodule points to a location which does not exist.");
        case GitErrorKind::InvalidSubmoduleSHA:
            return std::string("A submodule points to a commit which does not exist.");
        case GitErrorKind::LocalPermissionDenied:
            return std::string("Permission denied.");
        case GitErrorKind::InvalidMerge:
            return std::string("This is not something we can merge.");
        case GitErrorKind::InvalidRebase:
            return std::string("This is not something we can rebase.");
        case GitErrorKind::NonFastForwardMergeIntoEmptyHead:
            return std::string("The merge you attempted is not a fast-forward, so it cannot be performed on an empty branch.");
        case GitErrorKind::PatchDoesNotApply:
            return std::string("The requested changes conflict with one or more files in the repository.");
        case GitErrorKind::BranchAlreadyExists:
            return std::string("A branch with that name already exists.");
        case GitErrorKind::BadRevision:
            return std::string("Bad revision.");
        case GitErrorKind::NotAGitRepository:
            return std::string("This is not a git repository.");
        case GitErrorKind::CannotMergeUnrelatedHistories:
            return std::string("Unable to merge unrelated histories in this repository.");
        case GitErrorKind::LFSAttributeDoesNotMatch:
            return std::string("Git LFS attribute found in global Git configuration does not match the expected value.");
        case GitErrorKind::BranchRenameFailed:
            return std::string("The branch could not be renamed.");
        case GitErrorKind::PathDoesNotExist:
            return std::string("The path does not exist on disk.");
        case GitErrorKind::InvalidObjectName:
            return std::string("The object was not found in the Git repository.");
        case GitErrorKind::OutsideRepository:
            return std::string("This path is not a valid path inside the repository.");
        case GitErrorKind::LockFileAlreadyExists:
            return std::string("A lock file already exists in the repository, which blocks this operation from completing.");
        case GitErrorKind::NoMergeToAbort:
            return std::string("There is no merge in progress, so there is nothing to abort.");
        case GitErrorKind::LocalChangesOverwritten:
            return std::string("Unable to switch branches as there are working directory changes that would be overwritten. "
                               "Please commit or stash your changes.");
        case GitErrorKind::UnresolvedConflicts:
            return std::string("There are unresolved conflicts in the working directory.");
        case GitErrorKind::PushWithFileSizeExceedingLimit:
            return std::string("The push operation includes a file which exceeds GitHub's file size restriction of 100MB. "
                               "Please remove the file from history and try again.");
        case GitErrorKind::HexBranchNameRejected:
            return std::string("The branch name cannot be a 40-character string of hexadecimal characters, as this is the "
                               "format that Git uses for representing objects.");
        case GitErrorKind::ForcePushRejected:
            return std::string("The force push has been rejected for the current branch.");
        case GitErrorKind::InvalidRefLength:
            return std::string("A ref cannot be longer than 255 characters.");
        case GitErrorKind::ProtectedBranchRequiresReview:
            return std::string("This branch is protected and any changes require an approved review. Open a pull request "
                               "with changes targeting this branch instead.");
        case GitErrorKind::ProtectedBranchForcePush:
            return std::string("This branch is protected from force-push operations.");
        case GitErrorKind::ProtectedBranchDeleteRejected:
            return std::string("This branch cannot be deleted from the remote repository because it is marked as protected.");
        case GitErrorKind::ProtectedBranchRequiredStatus:
            return std::string("The push was rejected by the remote server because a required status check has not been satisfied.");
        case GitErrorKind::PushWithPrivateEmail:
            return std::string("Cannot push these commits as they contain an email address marked as private on GitHub. "
                               "Uncheck 'Keep my email address private' in your email settings to push, then enable it again.");
        // Detected, but callers supply their own copy
        case GitErrorKind::ConfigLockFileAlreadyExists:
        case GitErrorKind::RemoteAlreadyExists:
        case GitErrorKind::TagAlreadyExists:
        case GitErrorKind::MergeWithLocalChanges:
        case GitErrorKind::RebaseWithLocalChanges:
        case GitErrorKind::GPGFailedToSignData:
        case GitErrorKind::ConflictModifyDeletedInBranch:
        case GitErrorKind::MergeCommitNoMainlineOption:
        case GitErrorKind::UnsafeDirectory:
        case GitErrorKind::PathExistsButNotInRef:
            return std::nullopt;
    }
    return std::nullopt;
}

const ErrorTaxonomy& ErrorTaxonomy::instance() {
    static const ErrorTaxonomy taxonomy;
    return taxonomy;
}

ErrorTaxonomy::ErrorTaxonomy() : ruleTable(buildRuleTable()) {
    compiled.reserve(ruleTable.size());
    for (const auto& rule : ruleTable) {
        compiled.emplace_back(rule.pattern, std::regex::ECMAScript);
    }
}

std::optional<GitErrorKind> ErrorTaxonomy::classify(const std::string& text) const {
    for (size_t i = 0; i < compiled.size(); ++i) {
        std::smatch m;
        if (!std::regex_search(text, m, compiled[i])) continue;
        if (!ruleTable[i].precededBy.empty()) {
            size_t pos = text.find(ruleTable[i].precededBy);
            if (pos == std::string::npos ||
                pos + ruleTable[i].precededBy.size() >= static_cast<size_t>(m.position(0))) {
                continue;
            }
        }
        Logger::instance().debug(std::string("Classified git failure as ") + toString(ruleTable[i].kind));
        return ruleTable[i].kind;
    }
    return std::nullopt;
}

std::optional<GitErrorKind> ErrorTaxonomy::classify(const std::string& stderrText, const std::string& stdoutText) const {
    if (!stderrText.empty()) {
        auto kind = classify(stderrText);
        if (kind) return kind;
    }
    if (stdoutText.empty()) return std::nullopt;
    return classify(stdoutText);
}

std::vector<std::string> ErrorTaxonomy::oversizedFiles(const std::string& text) const {
    const std::string begin = Constants::FILE_SIZE_BEGIN_MARKER;
    const std::string end = Constants::FILE_SIZE_END_MARKER;

    // Begin markers only count at the start of a line
    std::vector<size_t> beginOffsets;
    for (size_t pos = text.find(begin); pos != std::string::npos; pos = text.find(begin, pos + 1)) {
        if (pos == 0 || text[pos - 1] == '\n') beginOffsets.push_back(pos + begin.size());
    }
    std::vector<size_t> endOffsets;
    for (size_t pos = text.find(end); pos != std::string::npos; pos = text.find(end, pos + end.size())) {
        endOffsets.push_back(pos);
    }

    if (beginOffsets.size() != endOffsets.size()) {
        Logger::instance().debug("Mismatched file size markers: " + std::to_string(beginOffsets.size()) +
                                 " begin, " + std::to_string(endOffsets.size()) + " end");
        return {};
    }

    std::vector<std::string> files;
    for (size_t i = 0; i < beginOffsets.size(); ++i) {
        if (endOffsets[i] < beginOffsets[i]) return {};
        std::string file = text.substr(beginOffsets[i], endOffsets[i] - beginOffsets[i]);
        // The size follows the last " is ", file names may contain the word
        size_t is = file.rfind(" is ");
        if (is != std::string::npos) file.replace(is, 4, " (");
        file += ")";
        files.push_back(file);
    }
    return files;
}

std::optional<std::string> ErrorTaxonomy::failureMessage(GitErrorKind kind, const std::string& text) const {
    auto message = describe(kind);
    if (!message || kind != GitErrorKind::PushWithFileSizeExceedingLimit) return message;

    auto files = oversizedFiles(text);
    if (files.empty()) return message;

    std::string joined;
    for (const auto& f : files) {
        if (!joined.empty()) joined += "\n";
        joined += f;
    }
    return *message + "\n\nFile causing error:\n\n" + joined;
}

}
