// src/common/remote/include/RemoteStateReader.hpp
#pragma once
#include "common/remote/include/ISecretService.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace secret_reconciler::remote
{
    /**
     * @brief 실행 시작 시점의 원격 시크릿 목록 (불변)
     *
     * 실행 동안 모든 시크릿 작업이 읽기 전용으로 공유한다.
     * 스냅샷 이후 외부에서 원격 상태가 바뀌는 경우는 감지하지 않는다.
     */
    class RemoteSnapshot
    {
    public:
        RemoteSnapshot() = default;
        explicit RemoteSnapshot(const std::vector<RemoteSecret>& secrets);

        // 없으면 nullptr
        const RemoteSecret* Find(const std::string& name) const;
        bool Contains(const std::string& name) const { return Find(name) != nullptr; }
        size_t Size() const { return secrets_.size(); }

    private:
        std::map<std::string, RemoteSecret> secrets_;
    };

    class RemoteStateReader
    {
    public:
        explicit RemoteStateReader(std::shared_ptr<ISecretService> service);

        /**
         * @brief 목록 조회 1회 → 스냅샷
         * @throws RemoteListException 실행 전체 중단 사유
         */
        std::shared_ptr<const RemoteSnapshot> ListSecrets(const std::string& project) const;

        /**
         * @brief 접근 바인딩 조회 (serviceAccounts 가 선언된 기존 시크릿에 대해서만 호출)
         * @throws RemoteBestEffortException
         */
        PrincipalSet GetAccessBindings(const std::string& name, const std::string& project) const;

    private:
        std::shared_ptr<ISecretService> service_;
    };
}
