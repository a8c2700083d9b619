#include "validator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fmt/core.h>
#include <algorithm>
#include <string>
#include <system_error>

using Algorithm = Checksum::Algorithm;
using Kind = ValidationIssue::Kind;

namespace
{
    const std::string EMPTY_MD5 = "D41D8CD98F00B204E9800998ECF8427E";

    size_t countKind(const ValidationError &error, Kind kind)
    {
        return static_cast<size_t>(std::count_if(error.issues().begin(), error.issues().end(),
                                                 [kind](const ValidationIssue &issue) { return issue.kind == kind; }));
    }
}

class ValidatorTest : public ScratchDirTest
{
protected:
    void SetUp() override
    {
        ScratchDirTest::SetUp();
        fileA_ = writeFile("a.txt", "alpha");
        fileB_ = writeFile("b.txt", "beta");
    }

    // Validate and return the error; fails the test if nothing was thrown
    ValidationError expectFailure(const CompareRequest &request)
    {
        try
        {
            InputValidator::validate(request);
        }
        catch (const ValidationError &e)
        {
            return e;
        }
        ADD_FAILURE() << "validation unexpectedly succeeded";
        return ValidationError(std::vector<ValidationIssue>{});
    }

    std::string fileA_;
    std::string fileB_;
};

TEST_F(ValidatorTest, TwoFilesWithDefaults)
{
    CompareRequest request;
    request.files = {fileA_, fileB_};

    RunConfiguration config = InputValidator::validate(request);

    ASSERT_EQ(config.files.size(), 2u);
    EXPECT_EQ(config.files[0], std::filesystem::path(fileA_));
    EXPECT_EQ(config.algorithms, std::vector<Algorithm>{Algorithm::SHA512});
    EXPECT_FALSE(config.expectedDigest.has_value());
    EXPECT_FALSE(config.quiet);
    EXPECT_FALSE(config.fast);
}

TEST_F(ValidatorTest, CarriesFlagsAndAlgorithms)
{
    CompareRequest request;
    request.files = {fileA_, fileB_};
    request.algorithms = {"sha1,md5"};
    request.quiet = true;
    request.fast = true;

    RunConfiguration config = InputValidator::validate(request);

    EXPECT_EQ(config.algorithms, (std::vector<Algorithm>{Algorithm::SHA1, Algorithm::MD5}));
    EXPECT_TRUE(config.quiet);
    EXPECT_TRUE(config.fast);
}

TEST_F(ValidatorTest, SingleFileWithoutExpectedHashIsInsufficient)
{
    CompareRequest request;
    request.files = {fileA_};

    ValidationError error = expectFailure(request);

    EXPECT_TRUE(error.has(Kind::InsufficientFiles));
}

TEST_F(ValidatorTest, SingleFileWithExpectedHashIsEnough)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = EMPTY_MD5;

    RunConfiguration config = InputValidator::validate(request);

    EXPECT_EQ(config.algorithms, std::vector<Algorithm>{Algorithm::MD5});
    ASSERT_TRUE(config.expectedDigest.has_value());
    EXPECT_EQ(*config.expectedDigest, EMPTY_MD5);
}

TEST_F(ValidatorTest, NoFilesWithExpectedHashIsInsufficient)
{
    CompareRequest request;
    request.expectedHash = EMPTY_MD5;

    ValidationError error = expectFailure(request);

    EXPECT_TRUE(error.has(Kind::InsufficientFiles));
}

TEST_F(ValidatorTest, ReportsMissingAndDirectoryPathsTogether)
{
    CompareRequest request;
    request.files = {fileA_, missing("nope.txt"), makeDir("folder"), missing("also-nope.txt")};

    ValidationError error = expectFailure(request);

    EXPECT_EQ(countKind(error, Kind::PathNotFound), 2u);
    EXPECT_EQ(countKind(error, Kind::PathIsDirectory), 1u);
    EXPECT_EQ(error.issues().size(), 3u);
}

TEST_F(ValidatorTest, IssueNamesOffendingPath)
{
    CompareRequest request;
    std::string gone = missing("gone.txt");
    request.files = {fileA_, gone};

    ValidationError error = expectFailure(request);

    ASSERT_EQ(error.issues().size(), 1u);
    EXPECT_EQ(error.issues()[0].subject, gone);
    EXPECT_NE(error.issues()[0].message.find(gone), std::string::npos);
    EXPECT_NE(std::string(error.what()).find(gone), std::string::npos);
}

TEST_F(ValidatorTest, UnreadableStatusIsNotReportedAsMissing)
{
    // Two links pointing at each other: status() fails with ELOOP
    std::filesystem::path first = dir_ / "loop-a";
    std::filesystem::path second = dir_ / "loop-b";
    std::filesystem::create_symlink(second, first);
    std::filesystem::create_symlink(first, second);

    CompareRequest request;
    request.files = {fileA_, first.string()};

    ValidationError error = expectFailure(request);

    ASSERT_EQ(error.issues().size(), 1u);
    const ValidationIssue &issue = error.issues()[0];
    EXPECT_EQ(issue.kind, Kind::PathInaccessible);
    EXPECT_EQ(issue.subject, first.string());
    EXPECT_EQ(issue.message.find("Path not found"), std::string::npos);
    EXPECT_EQ(issue.message,
              fmt::format("Cannot access path {}: {}", first.string(),
                          std::make_error_code(std::errc::too_many_symbolic_link_levels).message()));
}

TEST_F(ValidatorTest, DanglingSymlinkIsNotFound)
{
    std::filesystem::path link = dir_ / "dangling";
    std::filesystem::create_symlink(dir_ / "no-target", link);

    CompareRequest request;
    request.files = {fileA_, link.string()};

    ValidationError error = expectFailure(request);

    ASSERT_EQ(error.issues().size(), 1u);
    EXPECT_EQ(error.issues()[0].kind, Kind::PathNotFound);
}

TEST_F(ValidatorTest, ExpectedHashWithExplicitAlgorithmConflicts)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = EMPTY_MD5;
    request.algorithms = {"MD5"};

    ValidationError error = expectFailure(request);

    EXPECT_TRUE(error.has(Kind::ConflictingModes));
}

TEST_F(ValidatorTest, ExpectedHashWithAllConflicts)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = EMPTY_MD5;
    request.algorithms = {"All"};

    EXPECT_TRUE(expectFailure(request).has(Kind::ConflictingModes));
}

TEST_F(ValidatorTest, ExpectedHashWithDefaultAlgorithmIsAccepted)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = EMPTY_MD5;
    request.algorithms = {"SHA512"};

    RunConfiguration config = InputValidator::validate(request);

    EXPECT_EQ(config.algorithms, std::vector<Algorithm>{Algorithm::MD5});
}

TEST_F(ValidatorTest, UnsupportedDigestLengthListsTable)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = std::string(33, 'a');

    ValidationError error = expectFailure(request);

    ASSERT_TRUE(error.has(Kind::UnsupportedDigestLength));
    const std::string &message = error.issues().back().message;
    EXPECT_NE(message.find("MD5: 32"), std::string::npos);
    EXPECT_NE(message.find("SHA1: 40"), std::string::npos);
    EXPECT_NE(message.find("SHA256: 64"), std::string::npos);
    EXPECT_NE(message.find("SHA384: 96"), std::string::npos);
    EXPECT_NE(message.find("SHA512: 128"), std::string::npos);
}

TEST_F(ValidatorTest, InfersEveryAlgorithmFromLength)
{
    for (Algorithm algorithm : Checksum::allAlgorithms())
    {
        CompareRequest request;
        request.files = {fileA_};
        request.expectedHash = std::string(Checksum::digestLength(algorithm), '0');

        RunConfiguration config = InputValidator::validate(request);

        EXPECT_EQ(config.algorithms, std::vector<Algorithm>{algorithm}) << Checksum::algorithmName(algorithm);
    }
}

TEST_F(ValidatorTest, NonHexExpectedHashIsMalformed)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = std::string(31, 'a') + "z";

    ValidationError error = expectFailure(request);

    EXPECT_TRUE(error.has(Kind::MalformedDigest));
    EXPECT_FALSE(error.has(Kind::UnsupportedDigestLength));
}

TEST_F(ValidatorTest, ExpectedHashIsTrimmedButKeepsCase)
{
    CompareRequest request;
    request.files = {fileA_};
    request.expectedHash = "  " + EMPTY_MD5 + "\n";

    RunConfiguration config = InputValidator::validate(request);

    ASSERT_TRUE(config.expectedDigest.has_value());
    EXPECT_EQ(*config.expectedDigest, EMPTY_MD5);
}

TEST_F(ValidatorTest, ReportsEveryUnknownAlgorithm)
{
    CompareRequest request;
    request.files = {fileA_, fileB_};
    request.algorithms = {"SHA3,MD5", "CRC32"};

    ValidationError error = expectFailure(request);

    ASSERT_EQ(countKind(error, Kind::UnknownAlgorithm), 2u);
    EXPECT_EQ(error.issues()[0].subject, "SHA3");
    EXPECT_EQ(error.issues()[1].subject, "CRC32");
}

TEST_F(ValidatorTest, CollectsIssuesAcrossRules)
{
    CompareRequest request;
    request.files = {missing("gone.txt")};
    request.expectedHash = "abc";
    request.algorithms = {"SHA1"};

    ValidationError error = expectFailure(request);

    EXPECT_TRUE(error.has(Kind::PathNotFound));
    EXPECT_TRUE(error.has(Kind::ConflictingModes));
    EXPECT_TRUE(error.has(Kind::UnsupportedDigestLength));
    EXPECT_FALSE(error.has(Kind::InsufficientFiles));
}
