/*

outlook/mapi.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Extended MAPI pieces used by the exporter: the mapi32.dll entry points, the
IMAPISession and IConverterSession vtables (declared up to the members
called), the HGLOBAL backed stream and the MAPI-to-MIME converter.

*/

#pragma once

#include <mailarc/outlook/ole.hpp>

#include <objidl.h>

#include <cstring>
#include <memory>
#include <string>

#include <mailarc/detail/log.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc::outlook
{

// {4e3a7680-b77a-11d0-9da5-00c04fd65685}
inline constexpr CLSID clsid_converter_session =
    {0x4e3a7680, 0xb77a, 0x11d0, {0x9d, 0xa5, 0x00, 0xc0, 0x4f, 0xd6, 0x56, 0x85}};
// {4b401570-b77b-11d0-9da5-00c04fd65685}
inline constexpr IID iid_converter_session =
    {0x4b401570, 0xb77b, 0x11d0, {0x9d, 0xa5, 0x00, 0xc0, 0x4f, 0xd6, 0x56, 0x85}};
// {00020307-0000-0000-C000-000000000046}
inline constexpr IID iid_message =
    {0x00020307, 0x0000, 0x0000, {0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46}};

inline constexpr ULONG mapi_extended = 0x00000020;
inline constexpr ULONG ccsf_smtp = 0x0002;
inline constexpr ULONG save_rfc1521 = 1;
inline constexpr ULONG iet_qp = 3;
inline constexpr ULONG wrap_width = 74;

struct IMAPISession : public IUnknown
{
    virtual HRESULT STDMETHODCALLTYPE GetLastError(HRESULT, ULONG, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE GetMsgStoresTable(ULONG, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE OpenMsgStore(ULONG_PTR, ULONG, void*, const IID*, ULONG, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE OpenAddressBook(ULONG_PTR ui_param, const IID* iface, ULONG flags,
        IUnknown** address_book) = 0;
    virtual HRESULT STDMETHODCALLTYPE OpenProfileSection(const void*, const IID*, ULONG, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE GetStatusTable(ULONG, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE OpenEntry(ULONG, void*, const IID*, ULONG, ULONG*, IUnknown**) = 0;
    virtual HRESULT STDMETHODCALLTYPE CompareEntryIDs(ULONG, void*, ULONG, void*, ULONG, ULONG*) = 0;
    virtual HRESULT STDMETHODCALLTYPE Advise(ULONG, void*, ULONG, void*, ULONG_PTR*) = 0;
    virtual HRESULT STDMETHODCALLTYPE Unadvise(ULONG_PTR) = 0;
    virtual HRESULT STDMETHODCALLTYPE MessageOptions(ULONG_PTR, ULONG, LPWSTR, void*) = 0;
    virtual HRESULT STDMETHODCALLTYPE QueryDefaultMessageOpt(LPWSTR, ULONG, ULONG*, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE EnumAdrTypes(ULONG, ULONG*, LPWSTR**) = 0;
    virtual HRESULT STDMETHODCALLTYPE QueryIdentity(ULONG*, void**) = 0;
    virtual HRESULT STDMETHODCALLTYPE Logoff(ULONG_PTR ui_param, ULONG flags, ULONG reserved) = 0;
};

struct IConverterSession : public IUnknown
{
    virtual HRESULT STDMETHODCALLTYPE SetAdrBook(IUnknown* address_book) = 0;
    virtual HRESULT STDMETHODCALLTYPE SetEncoding(ULONG encoding) = 0;
    virtual HRESULT STDMETHODCALLTYPE PlaceHolder1() = 0;
    virtual HRESULT STDMETHODCALLTYPE MIMEToMAPI(IStream*, IUnknown*, LPCSTR, ULONG) = 0;
    virtual HRESULT STDMETHODCALLTYPE MAPIToMIMEStm(IUnknown* message, IStream* out, ULONG flags) = 0;
    virtual HRESULT STDMETHODCALLTYPE PlaceHolder2() = 0;
    virtual HRESULT STDMETHODCALLTYPE PlaceHolder3() = 0;
    virtual HRESULT STDMETHODCALLTYPE PlaceHolder4() = 0;
    virtual HRESULT STDMETHODCALLTYPE SetTextWrapping(BOOL wrap, ULONG width) = 0;
    virtual HRESULT STDMETHODCALLTYPE SetSaveFormat(ULONG format) = 0;
    virtual HRESULT STDMETHODCALLTYPE PlaceHolder5() = 0;
    virtual HRESULT STDMETHODCALLTYPE SetCharset(BOOL, void*, ULONG) = 0;
};

/**
 * mapi32.dll, loaded at runtime so the exporter starts without Outlook installed.
 */
class mapi_library
{
public:
    using initialize_fn = HRESULT(STDAPICALLTYPE*)(void*);
    using uninitialize_fn = void(STDAPICALLTYPE*)();
    using logon_fn = HRESULT(STDAPICALLTYPE*)(ULONG_PTR, LPSTR, LPSTR, ULONG, IMAPISession**);

    static result<std::unique_ptr<mapi_library>> load()
    {
        HMODULE mod = LoadLibraryW(L"mapi32.dll");
        if (mod == nullptr)
            return fail<std::unique_ptr<mapi_library>>(error_code::initialization_failed,
                "cannot load mapi32.dll", std::to_string(GetLastError()));
        std::unique_ptr<mapi_library> lib(new mapi_library(mod));
        lib->initialize_ = reinterpret_cast<initialize_fn>(GetProcAddress(mod, "MAPIInitialize"));
        lib->uninitialize_ = reinterpret_cast<uninitialize_fn>(GetProcAddress(mod, "MAPIUninitialize"));
        lib->logon_ = reinterpret_cast<logon_fn>(GetProcAddress(mod, "MAPILogonEx"));
        if (!lib->initialize_ || !lib->uninitialize_ || !lib->logon_)
            return fail<std::unique_ptr<mapi_library>>(error_code::initialization_failed,
                "mapi32.dll lacks Extended MAPI entry points");

        HRESULT hr = lib->initialize_(nullptr);
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<mapi_library>>(error_code::initialization_failed, "MAPIInitialize", hr);
        lib->initialized_ = true;
        return lib;
    }

    mapi_library(const mapi_library&) = delete;
    mapi_library& operator=(const mapi_library&) = delete;

    ~mapi_library()
    {
        if (initialized_)
            uninitialize_();
        FreeLibrary(module_);
    }

    /// Logon to the default profile
    result<com_ptr<IMAPISession>> logon()
    {
        com_ptr<IMAPISession> sess;
        HRESULT hr = logon_(0, nullptr, nullptr, mapi_extended, sess.put());
        if (FAILED(hr))
            return fail_hr<com_ptr<IMAPISession>>(error_code::session_failed, "MAPILogonEx", hr);
        return sess;
    }

private:
    explicit mapi_library(HMODULE mod) noexcept : module_(mod) {}

    HMODULE module_;
    initialize_fn initialize_ = nullptr;
    uninitialize_fn uninitialize_ = nullptr;
    logon_fn logon_ = nullptr;
    bool initialized_ = false;
};

/**
 * stream_buffer over CreateStreamOnHGlobal.
 */
class hglobal_stream : public stream_buffer
{
public:
    static result<std::unique_ptr<hglobal_stream>> create()
    {
        auto s = std::unique_ptr<hglobal_stream>(new hglobal_stream());
        HRESULT hr = CreateStreamOnHGlobal(nullptr, TRUE, s->stream_.put());
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<hglobal_stream>>(error_code::initialization_failed,
                "CreateStreamOnHGlobal", hr);
        return s;
    }

    [[nodiscard]] IStream* native() const noexcept { return stream_.get(); }

    result_void reset() override
    {
        LARGE_INTEGER zero{};
        HRESULT hr = stream_->Seek(zero, STREAM_SEEK_SET, nullptr);
        if (FAILED(hr))
            return fail_hr(error_code::stream_error, "Seek", hr);
        return ok();
    }

    result_void write(std::string_view bytes) override
    {
        ULONG written = 0;
        HRESULT hr = stream_->Write(bytes.data(), static_cast<ULONG>(bytes.size()), &written);
        if (FAILED(hr) || written != bytes.size())
            return fail_hr(error_code::stream_error, "Write", hr);
        return ok();
    }

    result<std::size_t> position() override
    {
        LARGE_INTEGER zero{};
        ULARGE_INTEGER pos{};
        HRESULT hr = stream_->Seek(zero, STREAM_SEEK_CUR, &pos);
        if (FAILED(hr))
            return fail_hr<std::size_t>(error_code::stream_error, "Seek", hr);
        return static_cast<std::size_t>(pos.QuadPart);
    }

    result<std::string> copy_out(std::size_t size) override
    {
        HGLOBAL mem = nullptr;
        HRESULT hr = GetHGlobalFromStream(stream_.get(), &mem);
        if (FAILED(hr))
            return fail_hr<std::string>(error_code::stream_error, "GetHGlobalFromStream", hr);
        if (GlobalSize(mem) < size)
            return fail<std::string>(error_code::stream_error, "stream shorter than its position");
        const void* addr = GlobalLock(mem);
        if (addr == nullptr)
            return fail<std::string>(error_code::stream_error, "Unable to GlobalLock");
        std::string out(static_cast<const char*>(addr), size);
        GlobalUnlock(mem);
        return out;
    }

private:
    hglobal_stream() = default;

    com_ptr<IStream> stream_;
};

/// IMessage behind an Outlook item (its MAPIOBJECT)
class mapi_message : public backing_object
{
public:
    explicit mapi_message(com_ptr<IUnknown> message) : message_(std::move(message)) {}

    [[nodiscard]] IUnknown* native() const noexcept { return message_.get(); }

private:
    com_ptr<IUnknown> message_;
};

/**
 * IConverterSession configured for RFC 1521 output, quoted-printable bodies
 * and 74 column wrapping.
 */
class mime_converter : public converter
{
public:
    static result<std::unique_ptr<mime_converter>> create()
    {
        com_ptr<IConverterSession> conv;
        HRESULT hr = CoCreateInstance(clsid_converter_session, nullptr, CLSCTX_INPROC_SERVER,
            iid_converter_session, reinterpret_cast<void**>(conv.put()));
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<mime_converter>>(error_code::converter_unavailable,
                "CoCreateInstance(IConverterSession)", hr);

        if (hr = conv->SetSaveFormat(save_rfc1521); FAILED(hr))
            MAILARC_WARN("SetSaveFormat: " + hresult_text(hr));
        if (hr = conv->SetEncoding(iet_qp); FAILED(hr))
            MAILARC_WARN("SetEncoding: " + hresult_text(hr));
        if (hr = conv->SetTextWrapping(TRUE, wrap_width); FAILED(hr))
            MAILARC_WARN("SetTextWrapping: " + hresult_text(hr));
        return std::unique_ptr<mime_converter>(new mime_converter(std::move(conv)));
    }

    result_void set_address_book(IUnknown* address_book)
    {
        HRESULT hr = conv_->SetAdrBook(address_book);
        if (FAILED(hr))
            return fail_hr(error_code::address_book_unavailable, "SetAdrBook", hr);
        return ok();
    }

    result_void convert(backing_object& message, stream_buffer& out) override
    {
        auto* msg = dynamic_cast<mapi_message*>(&message);
        auto* stm = dynamic_cast<hglobal_stream*>(&out);
        if (msg == nullptr || stm == nullptr)
            return fail(error_code::conversion_failed, "foreign message or stream");

        HRESULT hr = conv_->MAPIToMIMEStm(msg->native(), stm->native(), ccsf_smtp);
        if (FAILED(hr))
            return fail_hr(error_code::conversion_failed, "MAPIToMIMEStm", hr);
        return ok();
    }

private:
    explicit mime_converter(com_ptr<IConverterSession> conv) : conv_(std::move(conv)) {}

    com_ptr<IConverterSession> conv_;
};

} // namespace mailarc::outlook
