// src/common/remote/include/ISecretService.hpp
#pragma once
#include "common/types/SecretTypes.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace secret_reconciler::remote
{
    /**
     * @brief 원격 시크릿 관리 서비스 공통 인터페이스
     *
     * 운영 구현체는 gcloud CLI 를 호출하고 (GcloudSecretService),
     * 테스트는 메모리 상의 fake 로 대체한다.
     *
     * 모든 호출은 project 한정자를 받는다 (빈 문자열 = 기본 프로젝트).
     * 실패 시 RemoteException.hpp 의 예외를 던진다.
     */
    class ISecretService
    {
    public:
        virtual ~ISecretService() = default;

        /**
         * @brief 시크릿 목록 + 라벨 조회
         * @return 짧은 이름 (projects/.../secrets/ 접두사 제거) 기준 목록
         * @throws RemoteListException
         */
        virtual std::vector<RemoteSecret> ListSecrets(const std::string& project) = 0;

        /**
         * @brief 초기 라벨과 자동 복제 정책으로 시크릿 생성 (첫 버전 포함)
         * @param data_file 첫 버전으로 업로드할 payload 파일
         * @throws RemoteCreateException
         */
        virtual void CreateSecret(const std::string& name,
                                  const std::filesystem::path& data_file,
                                  const LabelList& labels,
                                  const std::string& project) = 0;

        /**
         * @brief 새 버전 추가
         * @return 새 버전 번호 (예: "4")
         * @throws RemoteVersionException
         */
        virtual std::string AddVersion(const std::string& name,
                                       const std::filesystem::path& data_file,
                                       const std::string& project) = 0;

        /**
         * @brief 라벨 전체 교체 (clear + set, 빈 목록이면 clear 만)
         * @throws RemoteBestEffortException
         */
        virtual void UpdateLabels(const std::string& name,
                                  const LabelList& labels,
                                  const std::string& project) = 0;

        // @throws RemoteBestEffortException
        virtual void DisableVersion(const std::string& name, const std::string& version, const std::string& project) = 0;

        // @throws RemoteBestEffortException
        virtual void DestroyVersion(const std::string& name, const std::string& version, const std::string& project) = 0;

        /**
         * @brief secretAccessor 역할에 바인딩된 멤버 조회
         * @throws RemoteBestEffortException
         */
        virtual PrincipalSet GetAccessBindings(const std::string& name, const std::string& project) = 0;

        // @throws RemoteBestEffortException
        virtual void AddAccessBinding(const std::string& name, const std::string& member, const std::string& project) = 0;

        // @throws RemoteBestEffortException
        virtual void RemoveAccessBinding(const std::string& name, const std::string& member, const std::string& project) = 0;
    };
}
