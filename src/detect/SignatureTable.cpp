#include "detect/SignatureTable.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

using namespace fv::detect;

namespace {

constexpr int CONTAINER_PRIORITY = 10;

MagicPattern hex(const std::string_view h, const size_t offset = 0, const int priority = 0) {
    return MagicPattern::fromHex(h, offset, priority);
}

MagicPattern text(const std::string_view t, const size_t offset = 0) {
    return MagicPattern::fromText(t, offset);
}

}

SignatureTable::SignatureTable(std::vector<Signature> signatures) : signatures_(std::move(signatures)) {
    std::unordered_set<std::string> seen;

    for (size_t s = 0; s < signatures_.size(); ++s) {
        const auto& sig = signatures_[s];
        if (sig.content_type.empty() || sig.content_type == UNKNOWN_CONTENT_TYPE)
            throw std::invalid_argument("Invalid content type identifier: '" + sig.content_type + "'");
        if (!seen.insert(sig.content_type).second)
            throw std::invalid_argument("Duplicate content type: " + sig.content_type);
        if (sig.patterns.empty())
            throw std::invalid_argument("Signature without patterns: " + sig.content_type);

        for (size_t p = 0; p < sig.patterns.size(); ++p) {
            ordered_.push_back({s, p});
            required_bytes_ = std::max(required_bytes_, sig.patterns[p].span());
        }

        known_extensions_.insert(sig.accepted_extensions.begin(), sig.accepted_extensions.end());
    }

    std::ranges::stable_sort(ordered_, [this](const Entry& a, const Entry& b) {
        const auto& pa = patternOf(a);
        const auto& pb = patternOf(b);
        if (pa.priority != pb.priority) return pa.priority > pb.priority;
        return pa.specificity() > pb.specificity();
    });
}

const Signature* SignatureTable::find(const std::string& content_type) const {
    const auto it = std::ranges::find(signatures_, content_type, &Signature::content_type);
    return it == signatures_.end() ? nullptr : &*it;
}

SignatureTable SignatureTable::builtin() {
    std::vector<Signature> sigs;

    sigs.push_back({"pdf", {text("%PDF")}, {"pdf"}});
    sigs.push_back({"png", {hex("89 50 4E 47 0D 0A 1A 0A")}, {"png"}});
    sigs.push_back({"jpg", {hex("FF D8 FF")}, {"jpg", "jpeg", "jpe", "jfif"}});
    sigs.push_back({"gif", {text("GIF87a"), text("GIF89a")}, {"gif"}});

    // Office Open XML packages are ZIP archives whose first entry is
    // [Content_Types].xml; the local file header puts the name at byte 30.
    sigs.push_back({"ooxml",
                    {hex("50 4B 03 04", 0, CONTAINER_PRIORITY).then(text("[Content_Types].xml", 30))},
                    {"docx", "docm", "dotx", "xlsx", "xlsm", "xltx", "pptx", "pptm", "potx", "zip"}});
    sigs.push_back({"zip",
                    {hex("50 4B 03 04"), hex("50 4B 05 06"), hex("50 4B 07 08")},
                    {"zip", "jar", "apk", "docx", "xlsx", "pptx", "odt", "ods", "odp", "epub", "xpi", "whl"}});

    sigs.push_back({"exe", {text("MZ")}, {"exe", "dll", "sys", "scr", "cpl", "ocx", "drv", "efi"}});
    sigs.push_back({"elf", {hex("7F 45 4C 46")}, {"", "so", "o", "ko", "elf", "bin"}});
    sigs.push_back({"ole2", {hex("D0 CF 11 E0 A1 B1 1A E1")}, {"doc", "dot", "xls", "xlt", "ppt", "pot", "msg", "msi"}});

    sigs.push_back({"rar", {hex("52 61 72 21 1A 07")}, {"rar"}});
    sigs.push_back({"7z", {hex("37 7A BC AF 27 1C")}, {"7z"}});
    sigs.push_back({"iso", {text("CD001", 0x8001), text("CD001", 0x8801), text("CD001", 0x9001)}, {"iso"}});
    sigs.push_back({"tar", {text("ustar", 257)}, {"tar"}});
    sigs.push_back({"gz", {hex("1F 8B")}, {"gz", "tgz"}});
    sigs.push_back({"bz2", {text("BZh")}, {"bz2", "tbz2"}});

    sigs.push_back({"shell",
                    {text("#!/bin/sh"), text("#!/bin/bash"), text("#!/usr/bin/env bash"), text("#!/usr/bin/env sh")},
                    {"sh", "bash", ""}});
    sigs.push_back({"python",
                    {text("#!/usr/bin/python"), text("#!/usr/bin/env python")},
                    {"py", ""}});

    return SignatureTable(std::move(sigs));
}
