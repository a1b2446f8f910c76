#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <termcolor/termcolor.hpp>

#include "captcha.h"
#include "captcha_error.h"
#include "log.h"
#include "solver.h"

// One client, and with it one connection, per thread.
void CreateDecodeThread(const std::string& Username, const std::string& Password, const std::string& Path, bool UseHttp)
{
	try {
		Credentials Auth(Username, Password);
		std::unique_ptr<CaptchaClient> Client = UseHttp ? CaptchaClient::Http(Auth) : CaptchaClient::Socket(Auth);

		RetryPolicy Policy;
		Policy.MaxAttempts = 3;
		CaptchaSolver Solver(*Client, Policy);

		SolveResult Result = Solver.Solve(CaptchaSubmission::FromFile(Path));
		if (Result.Job.IsSolved()) {
			std::cout << termcolor::green << vformat("%s -> captcha %lld: %s\n", Path.c_str(), Result.Job.Id(), Result.Job.Text().c_str()) << termcolor::reset;
		}
		else {
			std::cout << termcolor::yellow << vformat("%s -> captcha %lld: %s\n", Path.c_str(), Result.Job.Id(), JobStatusName(Result.Job.Status())) << termcolor::reset;
		}
	}
	catch (const CaptchaError& e) {
		std::cout << termcolor::red << vformat("%s -> %s error: %s\n", Path.c_str(), ErrorKindName(e.Kind()), e.what()) << termcolor::reset;
	}
}

int main(int argc, char* argv[])
{
	if (argc < 4) {
		std::cout << "usage: " << argv[0] << " <username> <password> [--http] <image>..." << std::endl;
		return 1;
	}

	std::string Username = argv[1];
	std::string Password = argv[2];
	bool UseHttp = false;

	std::vector<std::thread> Threads;
	for (int Index = 3; Index < argc; ++Index) {
		std::string Argument = argv[Index];
		if (Argument == "--http") {
			UseHttp = true;
			continue;
		}
		Threads.emplace_back(CreateDecodeThread, Username, Password, Argument, UseHttp);
	}

	for (std::thread& Thread : Threads) {
		Thread.join();
	}
	return 0;
}
