// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18N_H_8702348912378412376
#define I18N_H_8702348912378412376

#include <cassert>
#include <memory>
#include <mutex>
#include <string>
#include "string_tools.h"


//minimal layer enabling text translation - without platform/library dependencies!

#define DGRID_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        dgrid::translate(DGRID_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) dgrid::translate(DGRID_TRANS_CONCAT_SUB(L, s), DGRID_TRANS_CONCAT_SUB(L, p), n)
//source and translation are required to use %x as number placeholder
//for plural form, which will be substituted automatically!!!

#ifdef __WXWINDOWS__
    static_assert(WXINTL_NO_GETTEXT_MACRO, "...must be defined to deactivate wxWidgets underscore macro");
#endif

namespace dgrid
{
//implement handler to enable program-wide localizations:
struct TranslationHandler
{
    //THREAD-SAFETY: "const" member must model thread-safe access!
    TranslationHandler() {}
    virtual ~TranslationHandler() {}

    virtual std::wstring translate(const std::wstring& text) const = 0; //simple translation
    virtual std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const = 0;

private:
    TranslationHandler           (const TranslationHandler&) = delete;
    TranslationHandler& operator=(const TranslationHandler&) = delete;
};

void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler); //take ownership
std::shared_ptr<const TranslationHandler> getTranslator();








//######################## implementation ##############################
namespace impl
{
struct GlobalTranslator
{
    std::mutex lock;
    std::shared_ptr<const TranslationHandler> handler;
};

inline
GlobalTranslator& refGlobalTranslator()
{
    static GlobalTranslator inst; //the handler is set once at startup and read from the UI thread => no destruction order issues
    return inst;
}
}


inline
std::shared_ptr<const TranslationHandler> getTranslator()
{
    impl::GlobalTranslator& gt = impl::refGlobalTranslator();
    std::lock_guard dummy(gt.lock);
    return gt.handler;
}


inline
void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler)
{
    impl::GlobalTranslator& gt = impl::refGlobalTranslator();
    std::lock_guard dummy(gt.lock);
    gt.handler = std::move(newHandler);
}


inline
std::wstring translate(const std::wstring& text)
{
    if (std::shared_ptr<const TranslationHandler> t = getTranslator()) //std::shared_ptr => temporarily take (shared) ownership while using the interface!
        return t->translate(text);
    return text;
}


//translate plural forms: "%x row" "%x rows"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    assert(contains(plural, L"%x"));

    if (std::shared_ptr<const TranslationHandler> t = getTranslator())
        return t->translate(singular, plural, n64);

    return replaceCpy(n64 == 1 || n64 == -1 ? singular : plural, L"%x", formatNumber(n64));
}
}

#endif //I18N_H_8702348912378412376
