// Repository: MetaSEI
// Component: Contract Test Base
// Purpose: Base fixture that records which contract rules each domain suite exercises.
// Copyright (c) 2025 MetaSEI

#ifndef METASEI_TESTS_BASE_CONTRACT_TEST_H_
#define METASEI_TESTS_BASE_CONTRACT_TEST_H_

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace metasei::tests
{

  // ContractRegistry tracks, per domain, the rule ids a suite promises to
  // cover and the ones its fixtures actually ran.
  class ContractRegistry
  {
  public:
    static ContractRegistry &Instance()
    {
      static ContractRegistry registry;
      return registry;
    }

    void RegisterExpected(const std::string &domain, const std::vector<std::string> &rule_ids)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      expected_[domain].insert(rule_ids.begin(), rule_ids.end());
    }

    void RegisterCovered(const std::string &domain, const std::vector<std::string> &rule_ids)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      covered_[domain].insert(rule_ids.begin(), rule_ids.end());
    }

    // Expected rule ids with no covering fixture, as "Domain/RULE".
    std::vector<std::string> MissingCoverage() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<std::string> missing;
      for (const auto &[domain, rules] : expected_)
      {
        const auto covered = covered_.find(domain);
        for (const auto &rule : rules)
        {
          if (covered == covered_.end() || covered->second.count(rule) == 0)
          {
            missing.push_back(domain + "/" + rule);
          }
        }
      }
      return missing;
    }

  private:
    ContractRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::set<std::string>> expected_;
    std::map<std::string, std::set<std::string>> covered_;
  };

  inline void RegisterExpectedDomainCoverage(const std::string &domain,
                                             const std::vector<std::string> &rule_ids)
  {
    ContractRegistry::Instance().RegisterExpected(domain, rule_ids);
  }

  class BaseContractTest : public ::testing::Test
  {
  protected:
    [[nodiscard]] virtual std::string DomainName() const = 0;
    [[nodiscard]] virtual std::vector<std::string> CoveredRuleIds() const = 0;

    void SetUp() override
    {
      ContractRegistry::Instance().RegisterCovered(DomainName(), CoveredRuleIds());
    }
  };

} // namespace metasei::tests

#endif // METASEI_TESTS_BASE_CONTRACT_TEST_H_
