/*

outlook/ole.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Minimal OLE automation helpers: owning interface pointers, owning VARIANTs
and late-bound property/method calls on IDispatch. Windows only.

*/

#pragma once

#ifndef _WIN32
#error "mailarc/outlook requires Windows"
#endif

#include <windows.h>
#include <oleauto.h>

#include <chrono>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc::outlook
{

[[nodiscard]] inline std::string hresult_text(HRESULT hr)
{
    char buf[16]{};
    std::snprintf(buf, sizeof(buf), "0x%08lX", static_cast<unsigned long>(hr));
    return std::string("HRESULT ") + buf;
}

template<typename T = void>
[[nodiscard]] result<T> fail_hr(error_code code, std::string what, HRESULT hr)
{
    return fail<T>(code, std::move(what), hresult_text(hr));
}

/**
 * Owning COM interface pointer, released on destruction.
 */
template<typename I>
class com_ptr
{
public:
    com_ptr() = default;
    explicit com_ptr(I* p) noexcept : p_(p) {}
    com_ptr(const com_ptr&) = delete;
    com_ptr& operator=(const com_ptr&) = delete;
    com_ptr(com_ptr&& other) noexcept : p_(std::exchange(other.p_, nullptr)) {}
    com_ptr& operator=(com_ptr&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            p_ = std::exchange(other.p_, nullptr);
        }
        return *this;
    }
    ~com_ptr() { reset(); }

    void reset() noexcept
    {
        if (p_ != nullptr)
            std::exchange(p_, nullptr)->Release();
    }

    [[nodiscard]] I* get() const noexcept { return p_; }
    I* operator->() const noexcept { return p_; }
    explicit operator bool() const noexcept { return p_ != nullptr; }

    /// For out-parameters; releases the current pointer first
    I** put() noexcept
    {
        reset();
        return &p_;
    }

private:
    I* p_ = nullptr;
};

/**
 * Owning VARIANT.
 */
class variant
{
public:
    variant() noexcept { VariantInit(&v_); }
    variant(const variant&) = delete;
    variant& operator=(const variant&) = delete;
    ~variant() { VariantClear(&v_); }

    VARIANT* get() noexcept { return &v_; }
    [[nodiscard]] const VARIANT& ref() const noexcept { return v_; }
    [[nodiscard]] VARTYPE type() const noexcept { return v_.vt; }

private:
    VARIANT v_;
};

[[nodiscard]] inline std::wstring widen(std::string_view s)
{
    if (s.empty())
        return {};
    int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<std::size_t>(n), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
    return out;
}

[[nodiscard]] inline std::string narrow(const wchar_t* s, std::size_t len)
{
    if (s == nullptr || len == 0)
        return {};
    int n = WideCharToMultiByte(CP_UTF8, 0, s, static_cast<int>(len), nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<std::size_t>(n), '\0');
    WideCharToMultiByte(CP_UTF8, 0, s, static_cast<int>(len), out.data(), n, nullptr, nullptr);
    return out;
}

/// Argument of a late-bound call
struct arg
{
    enum class kind { integer, boolean, text } k;
    long i = 0;
    std::wstring s;

    arg(int v) : k(kind::integer), i(v) {}
    arg(std::size_t v) : k(kind::integer), i(static_cast<long>(v)) {}
    arg(bool v) : k(kind::boolean), i(v ? 1 : 0) {}
    arg(const wchar_t* v) : k(kind::text), s(v) {}
};

/**
 * IDispatch::Invoke by member name. Arguments are given in natural order.
 */
inline result_void invoke(IDispatch* obj, const wchar_t* name, WORD flags, variant& out,
    std::initializer_list<arg> args = {})
{
    if (obj == nullptr)
        return fail(error_code::unexpected_handle, "null IDispatch");

    DISPID id = 0;
    LPOLESTR names[] = {const_cast<LPOLESTR>(name)};
    HRESULT hr = obj->GetIDsOfNames(IID_NULL, names, 1, LOCALE_USER_DEFAULT, &id);
    if (FAILED(hr))
        return fail_hr(error_code::property_unavailable, narrow(name, wcslen(name)), hr);

    // IDispatch takes arguments right to left
    std::vector<VARIANT> vargs(args.size());
    std::size_t pos = args.size();
    for (const arg& a : args)
    {
        VARIANT& v = vargs[--pos];
        VariantInit(&v);
        switch (a.k)
        {
            case arg::kind::integer: v.vt = VT_I4; v.lVal = a.i; break;
            case arg::kind::boolean: v.vt = VT_BOOL; v.boolVal = a.i ? VARIANT_TRUE : VARIANT_FALSE; break;
            case arg::kind::text: v.vt = VT_BSTR; v.bstrVal = SysAllocString(a.s.c_str()); break;
        }
    }

    DISPPARAMS params{vargs.data(), nullptr, static_cast<UINT>(vargs.size()), 0};
    hr = obj->Invoke(id, IID_NULL, LOCALE_USER_DEFAULT, flags, &params, out.get(), nullptr, nullptr);
    for (VARIANT& v : vargs)
        VariantClear(&v);
    if (FAILED(hr))
        return fail_hr(error_code::property_unavailable, narrow(name, wcslen(name)), hr);
    return ok();
}

inline result_void get_property(IDispatch* obj, const wchar_t* name, variant& out,
    std::initializer_list<arg> args = {})
{
    WORD flags = args.size() == 0 ? DISPATCH_PROPERTYGET : DISPATCH_PROPERTYGET | DISPATCH_METHOD;
    return invoke(obj, name, flags, out, args);
}

inline result_void call_method(IDispatch* obj, const wchar_t* name, variant& out,
    std::initializer_list<arg> args = {})
{
    return invoke(obj, name, DISPATCH_METHOD, out, args);
}

[[nodiscard]] inline result<std::string> get_string(IDispatch* obj, const wchar_t* name)
{
    variant v;
    if (auto r = get_property(obj, name, v); !r)
        return fail<std::string>(r.error());
    if (v.type() != VT_BSTR)
        return fail<std::string>(error_code::property_unavailable, "not a string", narrow(name, wcslen(name)));
    return narrow(v.ref().bstrVal, SysStringLen(v.ref().bstrVal));
}

[[nodiscard]] inline result<long> get_long(IDispatch* obj, const wchar_t* name)
{
    variant v;
    if (auto r = get_property(obj, name, v); !r)
        return fail<long>(r.error());
    if (v.type() != VT_I4)
        return fail<long>(error_code::property_unavailable, "not an integer", narrow(name, wcslen(name)));
    return v.ref().lVal;
}

/// VT_DATE wall clock time, taken as UTC
[[nodiscard]] inline result<timestamp> get_date(IDispatch* obj, const wchar_t* name)
{
    variant v;
    if (auto r = get_property(obj, name, v); !r)
        return fail<timestamp>(r.error());
    if (v.type() != VT_DATE)
        return fail<timestamp>(error_code::property_unavailable, "not a date", narrow(name, wcslen(name)));
    SYSTEMTIME st{};
    if (!VariantTimeToSystemTime(v.ref().date, &st))
        return fail<timestamp>(error_code::property_unavailable, "date out of range", narrow(name, wcslen(name)));

    using namespace std::chrono;
    sys_days day{year{st.wYear} / month{st.wMonth} / std::chrono::day{st.wDay}};
    return timestamp{day + hours{st.wHour} + minutes{st.wMinute} + seconds{st.wSecond}};
}

/// Property holding another automation object
[[nodiscard]] inline result<com_ptr<IDispatch>> get_object(IDispatch* obj, const wchar_t* name,
    std::initializer_list<arg> args = {})
{
    variant v;
    if (auto r = get_property(obj, name, v, args); !r)
        return fail<com_ptr<IDispatch>>(r.error());
    if (v.type() != VT_DISPATCH || v.ref().pdispVal == nullptr)
        return fail<com_ptr<IDispatch>>(error_code::unexpected_handle, "not an object", narrow(name, wcslen(name)));
    IDispatch* d = v.ref().pdispVal;
    d->AddRef();
    return com_ptr<IDispatch>(d);
}

} // namespace mailarc::outlook
