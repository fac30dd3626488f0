/*

outlook/outlook_store.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Outlook object model (MAPIFolder, Items, MailItem) behind the mailbox
interfaces. Every call must come from the thread that created the session.

*/

#pragma once

#include <mailarc/outlook/mapi.hpp>
#include <mailarc/outlook/ole.hpp>

#include <memory>
#include <string>

#include <mailarc/detail/result.hpp>
#include <mailarc/source/mailbox.hpp>

namespace mailarc::outlook
{

class outlook_item : public item_handle
{
public:
    explicit outlook_item(com_ptr<IDispatch> item) : item_(std::move(item)) {}

    [[nodiscard]] result<std::string> subject() const override
    {
        return get_string(item_.get(), L"Subject");
    }

    [[nodiscard]] result<std::string> message_class() const override
    {
        return get_string(item_.get(), L"MessageClass");
    }

    [[nodiscard]] result<timestamp> creation_time() const override
    {
        return get_date(item_.get(), L"CreationTime");
    }

    result<std::unique_ptr<backing_object>> open_backing_object() override
    {
        variant v;
        if (auto r = get_property(item_.get(), L"MAPIOBJECT", v); !r)
            return fail<std::unique_ptr<backing_object>>(error_code::backing_object_unreadable,
                r.error().message(), r.error().context());
        if ((v.type() != VT_UNKNOWN && v.type() != VT_DISPATCH) || v.ref().punkVal == nullptr)
            return fail<std::unique_ptr<backing_object>>(error_code::backing_object_unreadable,
                "MAPIOBJECT is not an interface");

        com_ptr<IUnknown> message;
        HRESULT hr = v.ref().punkVal->QueryInterface(iid_message, reinterpret_cast<void**>(message.put()));
        if (FAILED(hr))
            return fail_hr<std::unique_ptr<backing_object>>(error_code::backing_object_unreadable,
                "QueryInterface(IMessage)", hr);
        return std::make_unique<mapi_message>(std::move(message));
    }

private:
    com_ptr<IDispatch> item_;
};

class outlook_items : public item_collection
{
public:
    explicit outlook_items(com_ptr<IDispatch> items) : items_(std::move(items)) {}

    result_void sort_by_creation_time(bool descending) override
    {
        variant out;
        return call_method(items_.get(), L"Sort", out, {L"[CreationTime]", descending});
    }

    result<std::size_t> count() override
    {
        auto n = get_long(items_.get(), L"Count");
        if (!n)
            return fail<std::size_t>(n.error());
        return static_cast<std::size_t>(*n);
    }

    result<std::unique_ptr<item_handle>> fetch(std::size_t position) override
    {
        auto item = get_object(items_.get(), L"Item", {position});
        if (!item)
            return fail<std::unique_ptr<item_handle>>(error_code::item_fetch_failed,
                item.error().message(), item.error().context());
        return std::make_unique<outlook_item>(std::move(*item));
    }

private:
    com_ptr<IDispatch> items_;
};

/**
 * A MAPIFolder, or the MAPI NameSpace at the top of the hierarchy (which
 * lacks most folder properties).
 */
class outlook_folder : public folder_handle
{
public:
    explicit outlook_folder(com_ptr<IDispatch> folder) : folder_(std::move(folder)) {}

    [[nodiscard]] result<std::string> name() const override { return get_string(folder_.get(), L"Name"); }
    [[nodiscard]] result<std::string> path() const override { return get_string(folder_.get(), L"FolderPath"); }
    [[nodiscard]] result<std::string> entry_id() const override { return get_string(folder_.get(), L"EntryID"); }

    [[nodiscard]] result<int> object_class() const override { return as_int(get_long(folder_.get(), L"Class")); }

    [[nodiscard]] result<int> default_item_type() const override
    {
        return as_int(get_long(folder_.get(), L"DefaultItemType"));
    }

    [[nodiscard]] result<std::string> default_message_class() const override
    {
        return get_string(folder_.get(), L"DefaultMessageClass");
    }

    [[nodiscard]] result<store_info> store() const override
    {
        auto st = get_object(folder_.get(), L"Store");
        if (!st)
            return fail<store_info>(st.error());
        store_info info;
        if (auto n = get_string(st->get(), L"DisplayName"))
            info.display_name = std::move(*n);
        if (auto p = get_string(st->get(), L"FilePath"))
            info.file_path = std::move(*p);
        return info;
    }

    result<std::size_t> subfolder_count() override
    {
        auto folders = subfolders();
        if (!folders)
            return fail<std::size_t>(folders.error());
        auto n = get_long(*folders, L"Count");
        if (!n)
            return fail<std::size_t>(n.error());
        return static_cast<std::size_t>(*n);
    }

    result<std::unique_ptr<folder_handle>> subfolder(std::size_t position) override
    {
        auto folders = subfolders();
        if (!folders)
            return fail<std::unique_ptr<folder_handle>>(folders.error());
        auto sub = get_object(*folders, L"Item", {position});
        if (!sub)
            return fail<std::unique_ptr<folder_handle>>(sub.error());
        return std::make_unique<outlook_folder>(std::move(*sub));
    }

    result<std::unique_ptr<item_collection>> items() override
    {
        auto items = get_object(folder_.get(), L"Items");
        if (!items)
            return fail<std::unique_ptr<item_collection>>(error_code::collection_unavailable,
                items.error().message(), items.error().context());
        return std::make_unique<outlook_items>(std::move(*items));
    }

private:
    static result<int> as_int(result<long> v)
    {
        if (!v)
            return fail<int>(v.error());
        return static_cast<int>(*v);
    }

    result<IDispatch*> subfolders()
    {
        if (!folders_)
        {
            auto f = get_object(folder_.get(), L"Folders");
            if (!f)
                return fail<IDispatch*>(f.error());
            folders_ = std::move(*f);
        }
        return folders_.get();
    }

    com_ptr<IDispatch> folder_;
    com_ptr<IDispatch> folders_;
};

} // namespace mailarc::outlook
