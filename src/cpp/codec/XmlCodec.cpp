/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/codec/XmlCodec.hpp"

#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/util/logging.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <array>
#include <string_view>
#include <source_location>

//-------------------------------------------------------------------------

namespace ordprops::codec
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string entryValue(pugi::xml_node entry)
{
    std::string value;
    for (pugi::xml_node child : entry.children()) {
        switch (child.type()) {
            case pugi::node_pcdata:
            case pugi::node_cdata:
                value += child.value();
                break;
            case pugi::node_comment:
            case pugi::node_pi:
                break;
            default:
                throw FormatError{fmt::format(
                    "{}: element <{}> not allowed inside <entry key=\"{}\">",
                    std::source_location::current().function_name(),
                    child.name(),
                    entry.attribute("key").value())};
        }
    }
    return value;
}

}  // namespace

//-------------------------------------------------------------------------

std::optional<XmlEncoding> XmlEncoding::fromName(std::string_view name)
{
    static const std::array<XmlEncoding, 8> s_supported{{
        {"UTF-8", pugi::encoding_utf8},
        {"UTF-16", pugi::encoding_utf16_be},
        {"UTF-16BE", pugi::encoding_utf16_be},
        {"UTF-16LE", pugi::encoding_utf16_le},
        {"UTF-32", pugi::encoding_utf32_be},
        {"UTF-32BE", pugi::encoding_utf32_be},
        {"UTF-32LE", pugi::encoding_utf32_le},
        {"ISO-8859-1", pugi::encoding_latin1},
    }};

    for (const auto& candidate : s_supported) {
        if (boost::algorithm::iequals(candidate.name, name)) {
            return candidate;
        }
    }
    return {};
}

//-------------------------------------------------------------------------

void XmlCodec::load(std::istream& is)
{
    if (is.fail()) {
        throw IOError{fmt::format(
            "{}: input stream is not readable",
            std::source_location::current().function_name())};
    }

    pugi::xml_document doc;
    const pugi::xml_parse_result result =
        doc.load(is, pugi::parse_default | pugi::parse_ws_pcdata_single);
    if (is.bad() || result.status == pugi::status_io_error) {
        throw IOError{fmt::format(
            "{}: failed reading XML input stream",
            std::source_location::current().function_name())};
    }
    if (!result) {
        throw FormatError{fmt::format(
            "{}: error parsing XML properties at offset {}: {}",
            std::source_location::current().function_name(),
            result.offset,
            result.description())};
    }

    const pugi::xml_node root = doc.document_element();
    if (std::string_view{root.name()} != "properties") {
        throw FormatError{fmt::format(
            "{}: expected root element <properties>, found <{}>",
            std::source_location::current().function_name(),
            root.name())};
    }

    size_t entryCount = 0;
    bool first = true;
    for (pugi::xml_node child : root.children()) {
        if (child.type() == pugi::node_comment || child.type() == pugi::node_pi) {
            continue;
        }
        if (child.type() != pugi::node_element) {
            if (boost::algorithm::all(std::string_view{child.value()}, boost::algorithm::is_space())) {
                continue;
            }
            throw FormatError{fmt::format(
                "{}: character data not allowed inside <properties>: '{}'",
                std::source_location::current().function_name(),
                child.value())};
        }

        const std::string_view name{child.name()};
        if (name == "comment" && first) {
            first = false;
            continue;
        }
        first = false;
        if (name != "entry") {
            throw FormatError{fmt::format(
                "{}: element <{}> not allowed here inside <properties>",
                std::source_location::current().function_name(),
                name)};
        }

        const pugi::xml_attribute keyAttr = child.attribute("key");
        if (!keyAttr) {
            throw FormatError{fmt::format(
                "{}: <entry> without required attribute 'key'",
                std::source_location::current().function_name())};
        }

        const std::string key = keyAttr.value();
        if (m_storage.contains(key)) {
            util::logger().debug("Duplicate XML entry for key '{}', later value wins", key);
        }
        m_storage.put(key, entryValue(child));
        ++entryCount;
    }

    util::logger().debug("Loaded {} properties from XML", entryCount);
}

//-------------------------------------------------------------------------

void XmlCodec::store(
    std::ostream& os, const std::optional<std::string>& comment, std::string_view encoding)
{
    const auto xmlEncoding = XmlEncoding::fromName(encoding);
    if (!xmlEncoding.has_value()) {
        util::logger().warn("Rejecting unsupported XML encoding '{}'", encoding);
        throw IOError{fmt::format(
            "{}: unsupported encoding '{}'",
            std::source_location::current().function_name(),
            encoding)};
    }

    pugi::xml_document doc;

    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = xmlEncoding->name.c_str();
    decl.append_attribute("standalone") = "no";

    doc.append_child(pugi::node_doctype).set_value(std::string{kPropertiesDoctype}.c_str());

    pugi::xml_node root = doc.append_child("properties");
    if (comment.has_value()) {
        root.append_child("comment").text().set(comment->c_str());
    }

    size_t entryCount = 0;
    for (const std::string& key : m_storage.keys()) {
        const auto value = m_storage.get(key);
        if (!value.has_value()) {
            continue;
        }
        pugi::xml_node entry = root.append_child("entry");
        entry.append_attribute("key") = key.c_str();
        entry.text().set(value->c_str());
        ++entryCount;
    }

    doc.save(os, "", pugi::format_indent, xmlEncoding->encoding);
    if (!os.flush()) {
        throw IOError{fmt::format(
            "{}: failed writing XML properties to output stream",
            std::source_location::current().function_name())};
    }

    util::logger().debug("Stored {} properties as XML ({})", entryCount, xmlEncoding->name);
}

//-------------------------------------------------------------------------

}  // namespace ordprops::codec

//-------------------------------------------------------------------------
