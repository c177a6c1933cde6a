#include <gtest/gtest.h>
#include <set>
#include <string>
#include "core/ErrorTaxonomy.hpp"

using namespace gitscribe;

class ErrorTaxonomyTest : public ::testing::Test {
protected:
    std::optional<GitErrorKind> classify(const std::string& text) {
        return ErrorTaxonomy::instance().classify(text);
    }

    const std::string oversizedPush =
        "remote: error: GH001: Large files detected. You may want to try Git Large File Storage.\n"
        "remote: error: File assets/big.bin is 120.00 MB; this exceeds GitHub's file size limit of 100.00 MB\n"
        "remote: error: File video/intro.mov is 250.50 MB; this exceeds GitHub's file size limit of 100.00 MB\n"
        "To https://github.com/owner/repo.git\n"
        " ! [remote rejected] main -> main (pre-receive hook declined)\n";
};

// Test: Plain authentication failure maps to the SSH kind
TEST_F(ErrorTaxonomyTest, AuthenticationFailed) {
    auto kind = classify("fatal: Authentication failed");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::SSHAuthenticationFailed);
}

// Test: The more specific HTTPS rule wins over the generic one
TEST_F(ErrorTaxonomyTest, HttpsAuthenticationPrecedesGeneric) {
    auto kind = classify("remote: Invalid username or password.\n"
                         "fatal: Authentication failed for 'https://github.com/owner/repo.git/'\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::HTTPSAuthenticationFailed);

    kind = classify("error: The requested URL returned error: 403");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::HTTPSAuthenticationFailed);
}

TEST_F(ErrorTaxonomyTest, RepositoryNotFound) {
    auto kind = classify("remote: Repository not found.\n"
                         "fatal: repository 'https://github.com/owner/missing.git/' not found\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::HTTPSRepositoryNotFound);
}

// Test: When several rules match, the earlier table entry wins
TEST_F(ErrorTaxonomyTest, FirstMatchingRuleWins) {
    auto kind = classify("ERROR: Repository not found.\n"
                         "fatal: Could not read from remote repository.\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::SSHPermissionDenied);

    kind = classify("ERROR: Your SSH key is too old.\n\n[EPOLICYKEYAGE]\n\n"
                    "fatal: Could not read from remote repository.\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::SSHKeyAuditUnverified);
}

// Test: Both forms of an unreachable host are recognized
TEST_F(ErrorTaxonomyTest, HostDown) {
    auto kind = classify("fatal: unable to access 'https://example.com/r.git/': "
                         "Failed to connect to example.com port 443: Host is down");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::HostDown);

    kind = classify("Cloning into 'repo'...\n"
                    "fatal: unable to access 'https://example.com/r.git/': Could not resolve host: example.com\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::HostDown);
}

// Test: Multi-line patterns need the newline at the right place
TEST_F(ErrorTaxonomyTest, MultiLinePushRejection) {
    auto kind = classify("To https://github.com/owner/repo.git\n"
                         " ! [rejected]        main -> main (fetch first)\n"
                         "error: failed to push some refs to 'https://github.com/owner/repo.git'\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::PushNotFastForward);

    EXPECT_FALSE(classify("(fetch first) error: failed to push some refs to 'x'").has_value());
}

TEST_F(ErrorTaxonomyTest, GitHubHookRejections) {
    auto kind = classify("remote: error: GH006: Protected branch update failed for refs/heads/main.\n"
                         "remote: error: Cannot delete a protected branch\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::ProtectedBranchDeleteRejected);

    kind = classify("remote: error: GH007: Your push would publish a private email address.");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::PushWithPrivateEmail);
}

TEST_F(ErrorTaxonomyTest, UnrecognizedText) {
    EXPECT_FALSE(classify("").has_value());
    EXPECT_FALSE(classify("Everything up-to-date").has_value());
}

// Test: stdout is consulted when stderr does not identify the failure
TEST_F(ErrorTaxonomyTest, FallsBackToStdout) {
    const auto& taxonomy = ErrorTaxonomy::instance();

    auto kind = taxonomy.classify("", "On branch main\nnothing to commit, working tree clean\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::NothingToCommit);

    kind = taxonomy.classify("warning: something harmless",
                             "Automatic merge failed; fix conflicts and then commit the result.\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::MergeConflicts);

    kind = taxonomy.classify("fatal: bad revision 'nope'", "nothing to commit");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::BadRevision);

    EXPECT_FALSE(taxonomy.classify("", "").has_value());
}

// Test: Authentication kinds share one message; some kinds have none
TEST_F(ErrorTaxonomyTest, Descriptions) {
    auto ssh = describe(GitErrorKind::SSHAuthenticationFailed);
    auto https = describe(GitErrorKind::HTTPSAuthenticationFailed);
    auto denied = describe(GitErrorKind::SSHPermissionDenied);
    ASSERT_TRUE(ssh.has_value());
    EXPECT_EQ(ssh, https);
    EXPECT_EQ(ssh, denied);
    EXPECT_EQ(ssh->rfind("Authentication failed.", 0), 0u);

    EXPECT_EQ(describe(GitErrorKind::HostDown),
              std::string("The host is down. Check your Internet connection and try again."));
    EXPECT_FALSE(describe(GitErrorKind::TagAlreadyExists).has_value());
    EXPECT_FALSE(describe(GitErrorKind::UnsafeDirectory).has_value());
}

// Test: Every rule names a distinct, printable kind
TEST_F(ErrorTaxonomyTest, RuleTableCoversKinds) {
    std::set<std::string> names;
    for (const auto& rule : ErrorTaxonomy::instance().rules()) {
        std::string name = toString(rule.kind);
        EXPECT_NE(name, "Unknown");
        EXPECT_TRUE(names.insert(name).second) << "duplicate rule for " << name;
    }
    EXPECT_EQ(names.size(), 58u);
}

TEST_F(ErrorTaxonomyTest, OversizedFiles) {
    auto files = ErrorTaxonomy::instance().oversizedFiles(oversizedPush);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "assets/big.bin (120.00 MB)");
    EXPECT_EQ(files[1], "video/intro.mov (250.50 MB)");
}

// Test: Unbalanced markers yield no file list
TEST_F(ErrorTaxonomyTest, OversizedFilesMismatchedMarkers) {
    std::string text = "remote: error: File a.bin is 101.00 MB; this exceeds GitHub's file size limit of 100.00 MB\n"
                       "remote: error: File b.bin is 102.00 MB\n";
    EXPECT_TRUE(ErrorTaxonomy::instance().oversizedFiles(text).empty());
    EXPECT_TRUE(ErrorTaxonomy::instance().oversizedFiles("").empty());
}

// Test: The size-limit message lists the offending files
TEST_F(ErrorTaxonomyTest, FailureMessageListsOversizedFiles) {
    const auto& taxonomy = ErrorTaxonomy::instance();
    auto kind = taxonomy.classify(oversizedPush);
    ASSERT_TRUE(kind.has_value());
    ASSERT_EQ(*kind, GitErrorKind::PushWithFileSizeExceedingLimit);

    auto message = taxonomy.failureMessage(*kind, oversizedPush);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message, *describe(*kind) +
                            "\n\nFile causing error:\n\nassets/big.bin (120.00 MB)\nvideo/intro.mov (250.50 MB)");

    // Without extractable files the plain description is returned
    EXPECT_EQ(taxonomy.failureMessage(*kind, "remote: error: GH001: Large files detected."), describe(*kind));
    EXPECT_EQ(taxonomy.failureMessage(GitErrorKind::NothingToCommit, oversizedPush),
              describe(GitErrorKind::NothingToCommit));
}

// Test: One representative message per rule classifies to that rule's kind
TEST_F(ErrorTaxonomyTest, EveryRuleRecognizesItsExample) {
    struct Example {
        GitErrorKind kind;
        const char* text;
    };
    const Example examples[] = {
        {GitErrorKind::SSHKeyAuditUnverified,
         "ERROR: You're using an RSA key with SHA-1, which is no longer allowed.\n\n[EPOLICYKEYAGE]\n\nfatal: Could not read from remote repository.\n"},
        {GitErrorKind::HTTPSAuthenticationFailed,
         "fatal: Authentication failed for 'https://github.com/owner/repo.git/'\n"},
        {GitErrorKind::SSHAuthenticationFailed,
         "fatal: Authentication failed\n"},
        {GitErrorKind::SSHPermissionDenied,
         "git@github.com: Permission denied (publickey).\nfatal: Could not read from remote repository.\n"},
        {GitErrorKind::RemoteDisconnection,
         "fatal: the remote end hung up unexpectedly\n"},
        {GitErrorKind::HostDown,
         "fatal: unable to access 'https://example.com/r.git/': Failed to connect to example.com port 443: Host is down\n"},
        {GitErrorKind::RebaseConflicts,
         "Resolve all conflicts manually, mark them as resolved with\n\"git add/rm <conflicted_files>\", then run \"git rebase --continue\".\n"},
        {GitErrorKind::MergeConflicts,
         "CONFLICT (content): Merge conflict in src/app.cpp\n"},
        {GitErrorKind::HTTPSRepositoryNotFound,
         "fatal: repository 'https://github.com/owner/missing.git/' not found\n"},
        {GitErrorKind::SSHRepositoryNotFound,
         "ERROR: Repository not found.\n"},
        {GitErrorKind::PushNotFastForward,
         " ! [rejected]        main -> main (non-fast-forward)\nerror: failed to push some refs to 'origin'\n"},
        {GitErrorKind::BranchDeletionFailed,
         "error: unable to delete 'feature': remote ref does not exist\n"},
        {GitErrorKind::DefaultBranchDeletionFailed,
         " ! [remote rejected] main (deletion of the current branch prohibited)\n"},
        {GitErrorKind::RevertConflicts,
         "error: could not revert 1a2b3c4... Change things\nhint: after resolving the conflicts, mark the corrected paths\nhint: with 'git add <paths>' or 'git rm <paths>'\nhint: and commit the result with 'git commit'\n"},
        {GitErrorKind::EmptyRebasePatch,
         "Applying: Tweak readme\nNo changes - did you forget to use 'git add'?\nIf there is nothing left to stage, chances are that something else\nalready introduced the same changes.\n"},
        {GitErrorKind::NoMatchingRemoteBranch,
         "There are no candidates for rebasing among the refs that you just fetched.\nGenerally this means that you provided a wildcard refspec which had no\nmatches on the remote end.\n"},
        {GitErrorKind::NoExistingRemoteBranch,
         "Your configuration specifies to merge with the ref 'refs/heads/gone'\nfrom the remote, but no such ref was fetched.\n"},
        {GitErrorKind::NothingToCommit,
         "On branch main\nnothing to commit, working tree clean\n"},
        {GitErrorKind::NoSubmoduleMapping,
         "fatal: no submodule mapping found in .gitmodules for path 'vendor/lib'\n"},
        {GitErrorKind::SubmoduleRepositoryDoesNotExist,
         "fatal: repository 'https://example.com/lib.git' does not exist\nfatal: clone of 'https://example.com/lib.git' into submodule path 'vendor/lib' failed\n"},
        {GitErrorKind::InvalidSubmoduleSHA,
         "Fetched in submodule path 'vendor/lib', but it did not contain 1a2b3c4d. Direct fetching of that commit failed.\n"},
        {GitErrorKind::LocalPermissionDenied,
         "fatal: could not create work tree dir 'repo': Permission denied\n"},
        {GitErrorKind::InvalidMerge,
         "merge: nosuchbranch - not something we can merge\n"},
        {GitErrorKind::InvalidRebase,
         "fatal: invalid upstream nosuchbranch\n"},
        {GitErrorKind::NonFastForwardMergeIntoEmptyHead,
         "fatal: Non-fast-forward commit does not make sense into an empty head\n"},
        {GitErrorKind::PatchDoesNotApply,
         "error: src/app.cpp: patch does not apply\n"},
        {GitErrorKind::BranchAlreadyExists,
         "fatal: A branch named 'feature' already exists.\n"},
        {GitErrorKind::BadRevision,
         "fatal: bad revision 'nope'\n"},
        {GitErrorKind::NotAGitRepository,
         "fatal: not a git repository (or any of the parent directories): .git\n"},
        {GitErrorKind::CannotMergeUnrelatedHistories,
         "fatal: refusing to merge unrelated histories\n"},
        {GitErrorKind::LFSAttributeDoesNotMatch,
         "The filter.lfs.clean attribute should be \"git-lfs clean -- %f\" but is \"\"\n"},
        {GitErrorKind::BranchRenameFailed,
         "fatal: Branch rename failed\n"},
        {GitErrorKind::PathDoesNotExist,
         "fatal: path 'missing.txt' does not exist in 'HEAD'\n"},
        {GitErrorKind::InvalidObjectName,
         "fatal: invalid object name 'nosuchref'.\n"},
        {GitErrorKind::OutsideRepository,
         "fatal: /tmp/other.txt: '/tmp/other.txt' is outside repository\n"},
        {GitErrorKind::LockFileAlreadyExists,
         "fatal: Unable to create '/repo/.git/index.lock': File exists.\n\nAnother git process seems to be running in this repository, e.g.\nan editor opened by 'git commit'.\n"},
        {GitErrorKind::NoMergeToAbort,
         "fatal: There is no merge to abort (MERGE_HEAD missing).\n"},
        {GitErrorKind::LocalChangesOverwritten,
         "error: Your local changes to the following files would be overwritten by checkout:\n\tsrc/app.cpp\n"},
        {GitErrorKind::UnresolvedConflicts,
         "error: Pulling is not possible because you have unmerged files.\nfatal: Exiting because of an unresolved conflict.\n"},
        {GitErrorKind::GPGFailedToSignData,
         "error: gpg failed to sign the data\nfatal: failed to write commit object\n"},
        {GitErrorKind::ConflictModifyDeletedInBranch,
         "CONFLICT (modify/delete): src/old.cpp deleted in feature and modified in HEAD.\n"},
        {GitErrorKind::PushWithFileSizeExceedingLimit,
         "remote: error: GH001: Large files detected.\n"},
        {GitErrorKind::HexBranchNameRejected,
         "remote: error: GH002: Sorry, branch or tag names consisting of 40 hex characters are not allowed.\n"},
        {GitErrorKind::ForcePushRejected,
         "remote: error: GH003: Sorry, force-pushing to main is not allowed.\n"},
        {GitErrorKind::InvalidRefLength,
         "remote: error: GH005: Sorry, refs longer than 255 bytes are not allowed.\n"},
        {GitErrorKind::ProtectedBranchRequiresReview,
         "remote: error: GH006: Protected branch update failed for refs/heads/main.\nremote: error: At least one approved review is required\n"},
        {GitErrorKind::ProtectedBranchForcePush,
         "remote: error: GH006: Protected branch update failed for refs/heads/main.\nremote: error: Cannot force-push to a protected branch\n"},
        {GitErrorKind::ProtectedBranchDeleteRejected,
         "remote: error: GH006: Protected branch update failed for refs/heads/main.\nremote: error: Cannot delete a protected branch\n"},
        {GitErrorKind::ProtectedBranchRequiredStatus,
         "remote: error: GH006: Protected branch update failed for refs/heads/main.\nremote: error: Required status check \"ci\" is expected.\n"},
        {GitErrorKind::PushWithPrivateEmail,
         "remote: error: GH007: Your push would publish a private email address.\n"},
        {GitErrorKind::ConfigLockFileAlreadyExists,
         "error: could not lock config file .git/config: File exists\n"},
        {GitErrorKind::RemoteAlreadyExists,
         "error: remote origin already exists.\n"},
        {GitErrorKind::TagAlreadyExists,
         "fatal: tag 'v1.0' already exists\n"},
        {GitErrorKind::MergeWithLocalChanges,
         "error: Your local changes to the following files would be overwritten by merge:\n\tsrc/app.cpp\n"},
        {GitErrorKind::RebaseWithLocalChanges,
         "error: cannot pull with rebase: You have unstaged changes.\nerror: please commit or stash them.\n"},
        {GitErrorKind::MergeCommitNoMainlineOption,
         "error: commit 1a2b3c4d is a merge but no -m option was given.\n"},
        {GitErrorKind::UnsafeDirectory,
         "fatal: detected dubious ownership in repository at '/srv/repo'\n"},
        {GitErrorKind::PathExistsButNotInRef,
         "fatal: path 'new.txt' exists on disk, but not in 'HEAD'\n"},
    };

    const auto& rules = ErrorTaxonomy::instance().rules();
    ASSERT_EQ(sizeof(examples) / sizeof(examples[0]), rules.size());
    for (size_t i = 0; i < rules.size(); ++i) {
        SCOPED_TRACE(toString(examples[i].kind));
        EXPECT_EQ(examples[i].kind, rules[i].kind);
        auto kind = classify(examples[i].text);
        ASSERT_TRUE(kind.has_value());
        EXPECT_EQ(toString(*kind), std::string(toString(examples[i].kind)));
    }
}

// Test: A long hook dump after "ERROR: " still classifies by its last line
TEST_F(ErrorTaxonomyTest, LongHookOutput) {
    std::string text = "ERROR: hook output\n";
    while (text.size() < 120000) text += "remote: hook line with some text in it\n";
    std::string denied = text + "fatal: Could not read from remote repository.\n";

    auto kind = classify(denied);
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::SSHPermissionDenied);

    std::string keyAge = text + "\n[EPOLICYKEYAGE]\n\nfatal: Could not read from remote repository.\n";
    kind = classify(keyAge);
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::SSHKeyAuditUnverified);

    // The key-age marker alone, without the ERROR line, is a plain permission failure
    kind = classify("[EPOLICYKEYAGE]\nfatal: Could not read from remote repository.\n");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, GitErrorKind::SSHPermissionDenied);
}

// Test: File names containing " is " keep their text, only the size separator changes
TEST_F(ErrorTaxonomyTest, OversizedFileNameContainingIs) {
    std::string text =
        "remote: error: File analysis is done.bin is 120.00 MB; this exceeds GitHub's file size limit of 100.00 MB\n"
        "remote: error: File thesis.pdf is 101.00 MB; this exceeds GitHub's file size limit of 100.00 MB\n";
    auto files = ErrorTaxonomy::instance().oversizedFiles(text);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "analysis is done.bin (120.00 MB)");
    EXPECT_EQ(files[1], "thesis.pdf (101.00 MB)");
}
