/*

outlook/outlook_session.hpp
---------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide Outlook state: COM apartment, MAPI subsystem and logon, the
Outlook.Application automation object and its MAPI namespace. Created and
used on a single thread.

*/

#pragma once

#include <mailarc/outlook/mapi.hpp>
#include <mailarc/outlook/ole.hpp>
#include <mailarc/outlook/outlook_store.hpp>

#include <memory>
#include <string>

#include <mailarc/detail/log.hpp>
#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc::outlook
{

class outlook_session : public session
{
public:
    static result<std::unique_ptr<outlook_session>> create()
    {
        std::unique_ptr<outlook_session> s(new outlook_session());

        HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<outlook_session>>(error_code::initialization_failed, "CoInitializeEx", hr);
        s->com_initialized_ = true;

        auto mapi = mapi_library::load();
        if (!mapi)
            return fail<std::unique_ptr<outlook_session>>(mapi.error());
        s->mapi_ = std::move(*mapi);

        auto logon = s->mapi_->logon();
        if (!logon)
            return fail<std::unique_ptr<outlook_session>>(logon.error());
        s->mapi_session_ = std::move(*logon);

        CLSID clsid{};
        hr = CLSIDFromProgID(L"Outlook.Application", &clsid);
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<outlook_session>>(error_code::initialization_failed,
                "Outlook.Application is not registered", hr);
        hr = CoCreateInstance(clsid, nullptr, CLSCTX_LOCAL_SERVER, IID_IDispatch,
            reinterpret_cast<void**>(s->app_.put()));
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<outlook_session>>(error_code::initialization_failed,
                "Failed to create Outlook application", hr);

        variant ns;
        if (auto r = call_method(s->app_.get(), L"GetNamespace", ns, {L"MAPI"}); !r)
            return fail<std::unique_ptr<outlook_session>>(error_code::session_failed,
                r.error().message(), r.error().context());
        if (ns.type() != VT_DISPATCH || ns.ref().pdispVal == nullptr)
            return fail<std::unique_ptr<outlook_session>>(error_code::session_failed, "GetNamespace returned no object");
        ns.ref().pdispVal->AddRef();
        s->namespace_ = com_ptr<IDispatch>(ns.ref().pdispVal);
        return s;
    }

    outlook_session(const outlook_session&) = delete;
    outlook_session& operator=(const outlook_session&) = delete;

    ~outlook_session() override
    {
        namespace_.reset();
        app_.reset();
        if (mapi_session_)
            mapi_session_->Logoff(0, 0, 0);
        mapi_session_.reset();
        mapi_.reset();
        if (com_initialized_)
            CoUninitialize();
    }

    [[nodiscard]] std::string describe() const override
    {
        auto prop = [this](const wchar_t* name) {
            auto v = get_string(app_.get(), name);
            return v ? *v : std::string();
        };
        return "Name: " + prop(L"Name") + ", Version: " + prop(L"Version") +
            ", ProductCode: " + prop(L"ProductCode") + ", DefaultProfileName: " + prop(L"DefaultProfileName");
    }

    result<std::unique_ptr<folder_handle>> root_folder() override
    {
        namespace_->AddRef();
        return std::make_unique<outlook_folder>(com_ptr<IDispatch>(namespace_.get()));
    }

    result<std::unique_ptr<converter>> make_converter() override
    {
        auto conv = mime_converter::create();
        if (!conv)
            return fail<std::unique_ptr<converter>>(conv.error());
        return std::unique_ptr<converter>(std::move(*conv));
    }

    result<std::unique_ptr<stream_buffer>> make_stream_buffer() override
    {
        auto stm = hglobal_stream::create();
        if (!stm)
            return fail<std::unique_ptr<stream_buffer>>(stm.error());
        return std::unique_ptr<stream_buffer>(std::move(*stm));
    }

    result_void attach_address_book(converter& conv) override
    {
        auto* mime = dynamic_cast<mime_converter*>(&conv);
        if (mime == nullptr)
            return fail(error_code::address_book_unavailable, "converter does not take an address book");

        com_ptr<IUnknown> ab;
        HRESULT hr = mapi_session_->OpenAddressBook(0, nullptr, 0, ab.put());
        if (FAILED(hr))
            MAILARC_WARN("OpenAddressBook: " + hresult_text(hr));
        if (!ab)
            return fail_hr(error_code::address_book_unavailable, "OpenAddressBook", hr);
        return mime->set_address_book(ab.get());
    }

private:
    outlook_session() = default;

    bool com_initialized_ = false;
    std::unique_ptr<mapi_library> mapi_;
    com_ptr<IMAPISession> mapi_session_;
    com_ptr<IDispatch> app_;
    com_ptr<IDispatch> namespace_;
};

} // namespace mailarc::outlook
