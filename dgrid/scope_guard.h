// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_0581723498135743196
#define SCOPE_GUARD_H_0581723498135743196

#include <type_traits>
#include <utility>


namespace dgrid
{
/*  run cleanup code when leaving the scope, also during stack unwinding:

        ++layoutSuspendCount_;
        DGRID_ON_SCOPE_EXIT(--layoutSuspendCount_);

    cleanup code must not throw                                      */

template <typename F>
class ScopeExitGuard
{
public:
    explicit ScopeExitGuard(F&& fun) : fun_(std::move(fun)) {}

    ScopeExitGuard(ScopeExitGuard&& tmp) : fun_(std::move(tmp.fun_)), dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeExitGuard()
    {
        if (!dismissed_)
            fun_();
    }

private:
    ScopeExitGuard           (const ScopeExitGuard&) = delete;
    ScopeExitGuard& operator=(const ScopeExitGuard&) = delete;

    F fun_;
    bool dismissed_ = false;
};


template <class F> inline
auto makeScopeExitGuard(F&& fun) { return ScopeExitGuard<std::decay_t<F>>(std::forward<F>(fun)); }
}

#define DGRID_CONCAT_SUB(X, Y) X ## Y
#define DGRID_CONCAT(X, Y) DGRID_CONCAT_SUB(X, Y)

#define DGRID_ON_SCOPE_EXIT(X) [[maybe_unused]] auto DGRID_CONCAT(scopeGuard, __LINE__) = dgrid::makeScopeExitGuard([&]{ X; });

#endif //SCOPE_GUARD_H_0581723498135743196
