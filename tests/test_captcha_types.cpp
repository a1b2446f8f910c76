#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "captcha_error.h"
#include "captcha_types.h"
#include "fakes.h"

TEST(Credentials, UsernamePasswordForm)
{
	Credentials Auth("user", "pass");
	EXPECT_FALSE(Auth.UsesAuthToken());

	std::vector<std::pair<std::string, std::string>> Fields = Auth.Fields();
	ASSERT_EQ(2u, Fields.size());
	EXPECT_EQ("username", Fields[0].first);
	EXPECT_EQ("user", Fields[0].second);
	EXPECT_EQ("password", Fields[1].first);
	EXPECT_EQ("pass", Fields[1].second);
}

TEST(Credentials, AuthTokenTakesPrecedence)
{
	Credentials Auth("user", "pass", "token123");
	EXPECT_TRUE(Auth.UsesAuthToken());

	std::vector<std::pair<std::string, std::string>> Fields = Auth.Fields();
	ASSERT_EQ(1u, Fields.size());
	EXPECT_EQ("authtoken", Fields[0].first);
	EXPECT_EQ("token123", Fields[0].second);

	EXPECT_TRUE(Credentials::FromAuthToken("token").UsesAuthToken());
}

TEST(Credentials, RequiresOneCompleteForm)
{
	EXPECT_THROW(Credentials("user", ""), ValidationError);
	EXPECT_THROW(Credentials("", ""), ValidationError);
	EXPECT_THROW(Credentials::FromAuthToken(""), ValidationError);
}

TEST(CaptchaSubmission, ImageIsSniffed)
{
	CaptchaSubmission Submission = CaptchaSubmission::FromImage(PngHeader);
	EXPECT_TRUE(Submission.IsImage());
	EXPECT_EQ(ImageFormat::Png, Submission.ImageType());
	EXPECT_EQ(0, Submission.Type());
	EXPECT_STREQ("captchafile", Submission.ImageField());
	EXPECT_EQ(DBC_DEFAULT_TIMEOUT, Submission.DefaultTimeout());
}

TEST(CaptchaSubmission, ImageGroupUsesBannerField)
{
	CaptchaSubmission Submission = CaptchaSubmission::FromImage(PngHeader, 3);
	EXPECT_STREQ("banner", Submission.ImageField());
}

TEST(CaptchaSubmission, RejectsBadImages)
{
	EXPECT_THROW(CaptchaSubmission::FromImage(""), ValidationError);
	EXPECT_THROW(CaptchaSubmission::FromImage("not an image"), ValidationError);
	EXPECT_THROW(CaptchaSubmission::FromImage(PngHeader + std::string(DBC_MAX_UPLOAD_SIZE, 'x')), ValidationError);
}

TEST(CaptchaSubmission, ReadsFiles)
{
	std::string Path = ::testing::TempDir() + "dbccaptcha_submission.png";
	{
		std::ofstream File(Path, std::ios::out | std::ios::binary);
		File << PngHeader;
	}

	CaptchaSubmission Submission = CaptchaSubmission::FromFile(Path);
	EXPECT_EQ(PngHeader, Submission.Image());
	std::remove(Path.c_str());

	EXPECT_THROW(CaptchaSubmission::FromFile(::testing::TempDir() + "dbccaptcha_missing.png"), ValidationError);
}

TEST(CaptchaSubmission, TokenTypeSelectsField)
{
	CaptchaSubmission Recaptcha = CaptchaSubmission::FromToken(5, "{\"googlekey\":\"key\"}");
	EXPECT_FALSE(Recaptcha.IsImage());
	EXPECT_EQ(5, Recaptcha.Type());
	ASSERT_EQ(1u, Recaptcha.Params().count("token_params"));
	EXPECT_EQ(DBC_DEFAULT_TOKEN_TIMEOUT, Recaptcha.DefaultTimeout());

	EXPECT_EQ(1u, CaptchaSubmission::FromToken(7, "{}").Params().count("hcaptcha_params"));
	EXPECT_EQ(1u, CaptchaSubmission::FromToken(9, "{}").Params().count("geetest_params"));
	EXPECT_EQ(1u, CaptchaSubmission::FromToken(14, "{}").Params().count("lemin_params"));
	EXPECT_EQ(1u, CaptchaSubmission::FromToken(16, "{}").Params().count("waf_params"));
	EXPECT_EQ(1u, CaptchaSubmission::FromToken(19, "{}").Params().count("cutcaptcha_params"));
	EXPECT_EQ(1u, CaptchaSubmission::FromToken(25, "{}").Params().count("token_enterprise_params"));

	EXPECT_THROW(CaptchaSubmission::FromToken(0, "{}"), ValidationError);
	EXPECT_THROW(CaptchaSubmission::FromToken(4, ""), ValidationError);
}

TEST(CaptchaSubmission, ParamsAreOpaque)
{
	CaptchaParams Params;
	Params["audio"] = "UklGRg==";
	Params["language"] = "en";

	CaptchaSubmission Audio = CaptchaSubmission::FromParams(13, Params);
	EXPECT_FALSE(Audio.IsImage());
	EXPECT_EQ(Params, Audio.Params());
	EXPECT_THROW(CaptchaSubmission::FromParams(13, CaptchaParams()), ValidationError);
}

TEST(CaptchaJob, WalksTheLifecycle)
{
	TimePoint Now = std::chrono::steady_clock::time_point();
	CaptchaJob Job;
	EXPECT_EQ(JobStatus::Created, Job.Status());

	Job.Start(Now);
	Job.MarkSubmitted(12);
	EXPECT_EQ(JobStatus::Submitted, Job.Status());
	Job.MarkPolling();
	Job.RecordPoll(PollAttempt());
	Job.MarkSolved("abc", Now + std::chrono::seconds(3));

	EXPECT_TRUE(Job.IsSolved());
	EXPECT_EQ(12, Job.Id());
	EXPECT_EQ("abc", Job.Text());
	EXPECT_TRUE(Job.HasCorrectness());
	EXPECT_EQ(1u, Job.Polls().size());
	EXPECT_EQ(std::chrono::seconds(3), Job.ResolvedAt() - Job.CreatedAt());
}

TEST(CaptchaJob, IdIsAssignedOnce)
{
	CaptchaJob Job;
	Job.MarkSubmitted(12);
	EXPECT_THROW(Job.MarkSubmitted(13), std::logic_error);
	EXPECT_EQ(12, Job.Id());
}

TEST(CaptchaJob, TerminalStatesDoNotReopen)
{
	TimePoint Now = std::chrono::steady_clock::time_point();
	CaptchaJob Job;
	Job.MarkSubmitted(1);
	Job.MarkPolling();
	Job.MarkTimedOut(Now);

	EXPECT_THROW(Job.MarkSolved("late", Now), std::logic_error);
	EXPECT_THROW(Job.MarkExpired(Now), std::logic_error);
	EXPECT_THROW(Job.MarkPolling(), std::logic_error);
	EXPECT_EQ(JobStatus::Timeout, Job.Status());
	EXPECT_TRUE(Job.Text().empty());
}

TEST(CaptchaJob, CannotSkipSubmission)
{
	CaptchaJob Job;
	EXPECT_THROW(Job.MarkPolling(), std::logic_error);
	EXPECT_THROW(Job.MarkSolved("abc", TimePoint()), std::logic_error);
}
