// src/common/utils/process/CommandRunner.hpp
#pragma once
#include <string>
#include <vector>

namespace secret_reconciler::utils
{
    struct CommandResult
    {
        int exit_code = -1;
        std::string stdout_text;
        std::string stderr_text;

        bool Succeeded() const { return exit_code == 0; }
    };

    /**
     * @brief 외부 명령 실행 인터페이스 (테스트에서 명령줄 검증용으로 교체)
     */
    class ICommandRunner
    {
    public:
        virtual ~ICommandRunner() = default;

        /**
         * @param argv argv[0] 은 실행 파일, 나머지는 인자 (셸 해석 없이 그대로 전달됨)
         */
        virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
    };

    /**
     * @brief popen 기반 실행기
     *
     * 각 인자는 작은따옴표로 감싸 셸 치환을 막는다.
     * stdout 은 파이프로, stderr 는 임시 파일로 따로 받는다 (JSON 출력에 경고가 섞이지 않도록).
     */
    class ShellCommandRunner : public ICommandRunner
    {
    public:
        CommandResult Run(const std::vector<std::string>& argv) override;

        static std::string QuoteArgument(const std::string& arg);
        static std::string BuildCommandLine(const std::vector<std::string>& argv);
    };
}
