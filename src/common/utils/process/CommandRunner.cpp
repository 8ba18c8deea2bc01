// src/common/utils/process/CommandRunner.cpp
#include "common/utils/process/CommandRunner.hpp"
#include "common/utils/logger/Logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace secret_reconciler::utils
{
    namespace
    {
        // mkstemp 로 만든 stderr 캡처 파일, 스코프 종료 시 삭제
        class TempCapture
        {
        public:
            TempCapture()
            {
                const char* tmp_dir = std::getenv("TMPDIR");
                std::string pattern = std::string(tmp_dir && *tmp_dir ? tmp_dir : "/tmp") + "/secret-reconciler-XXXXXX";
                std::vector<char> buffer(pattern.begin(), pattern.end());
                buffer.push_back('\0');

                int fd = mkstemp(buffer.data());
                if (fd < 0) {
                    throw std::runtime_error("mkstemp failed for stderr capture");
                }
                close(fd);
                path = buffer.data();
            }

            ~TempCapture()
            {
                if (!path.empty()) {
                    unlink(path.c_str());
                }
            }

            TempCapture(const TempCapture&) = delete;
            TempCapture& operator=(const TempCapture&) = delete;

            std::string Read() const
            {
                std::ifstream file(path);
                std::stringstream ss;
                ss << file.rdbuf();
                return ss.str();
            }

            std::string path;
        };
    }

    std::string ShellCommandRunner::QuoteArgument(const std::string& arg)
    {
        std::string quoted = "'";
        for (char c : arg) {
            if (c == '\'') {
                quoted += "'\\''";
            } else {
                quoted.push_back(c);
            }
        }
        quoted += "'";
        return quoted;
    }

    std::string ShellCommandRunner::BuildCommandLine(const std::vector<std::string>& argv)
    {
        std::string command;
        for (size_t i = 0; i < argv.size(); ++i) {
            if (i > 0) {
                command.push_back(' ');
            }
            command += QuoteArgument(argv[i]);
        }
        return command;
    }

    CommandResult ShellCommandRunner::Run(const std::vector<std::string>& argv)
    {
        if (argv.empty()) {
            throw std::invalid_argument("ShellCommandRunner::Run called without a command");
        }

        TempCapture stderr_capture;
        std::string command = BuildCommandLine(argv) + " 2>" + QuoteArgument(stderr_capture.path);

        LOG_DEBUGF("CommandRunner", "Executing: %s", BuildCommandLine(argv).c_str());

        CommandResult result;
        std::array<char, 4096> buffer;

        std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
        if (!pipe) {
            result.exit_code = -1;
            result.stderr_text = "failed to start command: " + argv[0];
            return result;
        }

        size_t read = 0;
        while ((read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
            result.stdout_text.append(buffer.data(), read);
        }

        int status = pclose(pipe.release());
        if (status == -1) {
            result.exit_code = -1;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else {
            result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
        }

        result.stderr_text = stderr_capture.Read();

        if (!result.Succeeded()) {
            LOG_DEBUGF("CommandRunner", "Command failed (exit code: %d)", result.exit_code);
        }
        return result;
    }
}
