#pragma once

#include <string>
#include <vector>

#include "account.hpp"
#include "thresholds.hpp"

enum class EAccountScope {
    System,
    Regular,
    All,
};

/*
 * System: id <= SystemMax, no lower bound.
 * Regular: RegularMin <= id <= RegularMax.
 * Ranges may overlap, then account is in both.
 */
bool InScope(const TAccount &account, const TThresholds &thresholds, EAccountScope scope);

/* Keeps database order */
std::vector<TAccount> ClassifyAccounts(const std::vector<TAccount> &accounts,
                                       const TThresholds &thresholds,
                                       EAccountScope scope);

std::string ScopeLabel(EAccountScope scope, bool implicit = false);
