#include "classifier.hpp"

bool InScope(const TAccount &account, const TThresholds &thresholds, EAccountScope scope) {
    switch (scope) {
        case EAccountScope::System:
            return account.Id <= thresholds.SystemMax;
        case EAccountScope::Regular:
            return thresholds.RegularMin <= account.Id &&
                   account.Id <= thresholds.RegularMax;
        case EAccountScope::All:
            return true;
    }
    return false;
}

std::vector<TAccount> ClassifyAccounts(const std::vector<TAccount> &accounts,
                                       const TThresholds &thresholds,
                                       EAccountScope scope) {
    std::vector<TAccount> result;

    for (auto &account: accounts)
        if (InScope(account, thresholds, scope))
            result.push_back(account);

    return result;
}

std::string ScopeLabel(EAccountScope scope, bool implicit) {
    switch (scope) {
        case EAccountScope::System:
            return "Showing system users";
        case EAccountScope::Regular:
            return implicit ? "Default: Showing standard users" : "Showing standard users";
        case EAccountScope::All:
            return "Showing all users";
    }
    return "";
}
