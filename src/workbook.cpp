// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cctype>
#include <chatconsole/workbook.hpp>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlwriter.h>
#include <optional>
#include <sstream>

namespace chatconsole::xlsx
{

namespace
{

constexpr const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
constexpr const char* kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
constexpr const char* kPackageRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char* kOfficeDocumentRel =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* kWorksheetRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char* kStylesRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";

constexpr const char* kDateFormat = "yyyy-mm-dd hh:mm:ss";
constexpr int kDateFormatId = 164;
constexpr int kDateStyleIndex = 1;
constexpr size_t kMaxSheetName = 31;

const CellValue kEmptyCell{};

// =============================================================================
// Text helpers
// =============================================================================

/// Replace invalid UTF-8 with U+FFFD and drop characters XML 1.0 cannot carry
std::string xml_safe(const std::string& in)
{
    static const char* kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size())
    {
        auto c = static_cast<unsigned char>(in[i]);
        if (c < 0x80)
        {
            if (c >= 0x20 || c == '\t' || c == '\n' || c == '\r')
                out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if (c >= 0xC2 && c <= 0xDF)
        {
            len = 2;
            cp = c & 0x1F;
        }
        else if (c >= 0xE0 && c <= 0xEF)
        {
            len = 3;
            cp = c & 0x0F;
        }
        else if (c >= 0xF0 && c <= 0xF4)
        {
            len = 4;
            cp = c & 0x07;
        }

        bool valid = len != 0 && i + len <= in.size();
        for (size_t k = 1; valid && k < len; ++k)
        {
            auto cc = static_cast<unsigned char>(in[i + k]);
            valid = (cc & 0xC0) == 0x80;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (valid && len == 3)
            valid = cp >= 0x800 && !(cp >= 0xD800 && cp <= 0xDFFF) && cp != 0xFFFE && cp != 0xFFFF;
        if (valid && len == 4)
            valid = cp >= 0x10000 && cp <= 0x10FFFF;

        if (valid)
        {
            out.append(in, i, len);
            i += len;
        }
        else
        {
            out += kReplacement;
            ++i;
        }
    }
    return out;
}

std::string format_number(double value, const char* format)
{
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), format, value);
    return buffer;
}

std::string column_name(size_t column)
{
    std::string name;
    while (column > 0)
    {
        --column;
        name.insert(name.begin(), static_cast<char>('A' + column % 26));
        column /= 26;
    }
    return name;
}

/// Split an A1-style reference; missing parts come back as 0
std::pair<size_t, size_t> parse_reference(const std::string& ref)
{
    size_t column = 0;
    size_t row = 0;
    size_t i = 0;
    for (; i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i])); ++i)
        column = column * 26 + static_cast<size_t>(std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
    for (; i < ref.size() && std::isdigit(static_cast<unsigned char>(ref[i])); ++i)
        row = row * 10 + static_cast<size_t>(ref[i] - '0');
    return {row, column};
}

std::string format_local_time(std::chrono::system_clock::time_point time)
{
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

// =============================================================================
// XML writing
// =============================================================================

/// xmlTextWriter into a memory buffer
class XmlWriter
{
  public:
    XmlWriter()
    {
        buffer_ = xmlBufferCreate();
        if (!buffer_)
            throw WorkbookError("Out of memory creating XML buffer");
        writer_ = xmlNewTextWriterMemory(buffer_, 0);
        if (!writer_)
        {
            xmlBufferFree(buffer_);
            throw WorkbookError("Cannot create XML writer");
        }
        check(xmlTextWriterStartDocument(writer_, nullptr, "UTF-8", "yes"));
    }

    ~XmlWriter()
    {
        if (writer_)
            xmlFreeTextWriter(writer_);
        xmlBufferFree(buffer_);
    }

    XmlWriter(const XmlWriter&) = delete;
    XmlWriter& operator=(const XmlWriter&) = delete;

    void start(const char* name)
    {
        check(xmlTextWriterStartElement(writer_, BAD_CAST name));
    }

    void attribute(const char* name, const std::string& value)
    {
        check(xmlTextWriterWriteAttribute(writer_, BAD_CAST name, BAD_CAST xml_safe(value).c_str()));
    }

    void text(const std::string& value)
    {
        check(xmlTextWriterWriteString(writer_, BAD_CAST xml_safe(value).c_str()));
    }

    void end()
    {
        check(xmlTextWriterEndElement(writer_));
    }

    /// Element with attributes and no content
    void empty(const char* name, std::initializer_list<std::pair<const char*, std::string>> attributes)
    {
        start(name);
        for (const auto& [key, value] : attributes)
            attribute(key, value);
        end();
    }

    std::string finish()
    {
        check(xmlTextWriterEndDocument(writer_));
        xmlFreeTextWriter(writer_);
        writer_ = nullptr;
        return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer_)), xmlBufferLength(buffer_));
    }

  private:
    static void check(int rc)
    {
        if (rc < 0)
            throw WorkbookError("XML serialization failed");
    }

    xmlBufferPtr buffer_ = nullptr;
    xmlTextWriterPtr writer_ = nullptr;
};

std::string content_types_xml(size_t sheet_count)
{
    XmlWriter w;
    w.start("Types");
    w.attribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");
    w.empty(
        "Default",
        {{"Extension", "rels"}, {"ContentType", "application/vnd.openxmlformats-package.relationships+xml"}}
    );
    w.empty("Default", {{"Extension", "xml"}, {"ContentType", "application/xml"}});
    w.empty(
        "Override",
        {{"PartName", "/xl/workbook.xml"},
         {"ContentType", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml"}}
    );
    for (size_t i = 1; i <= sheet_count; ++i)
        w.empty(
            "Override",
            {{"PartName", "/xl/worksheets/sheet" + std::to_string(i) + ".xml"},
             {"ContentType", "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml"}}
        );
    w.empty(
        "Override",
        {{"PartName", "/xl/styles.xml"},
         {"ContentType", "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml"}}
    );
    w.end();
    return w.finish();
}

std::string package_rels_xml()
{
    XmlWriter w;
    w.start("Relationships");
    w.attribute("xmlns", kPackageRelNs);
    w.empty("Relationship", {{"Id", "rId1"}, {"Type", kOfficeDocumentRel}, {"Target", "xl/workbook.xml"}});
    w.end();
    return w.finish();
}

std::string workbook_xml(const std::vector<std::unique_ptr<Worksheet>>& sheets)
{
    XmlWriter w;
    w.start("workbook");
    w.attribute("xmlns", kMainNs);
    w.attribute("xmlns:r", kRelNs);
    w.start("sheets");
    for (size_t i = 0; i < sheets.size(); ++i)
    {
        std::string n = std::to_string(i + 1);
        w.empty("sheet", {{"name", sheets[i]->name()}, {"sheetId", n}, {"r:id", "rId" + n}});
    }
    w.end();
    w.end();
    return w.finish();
}

std::string workbook_rels_xml(size_t sheet_count)
{
    XmlWriter w;
    w.start("Relationships");
    w.attribute("xmlns", kPackageRelNs);
    for (size_t i = 1; i <= sheet_count; ++i)
        w.empty(
            "Relationship",
            {{"Id", "rId" + std::to_string(i)},
             {"Type", kWorksheetRel},
             {"Target", "worksheets/sheet" + std::to_string(i) + ".xml"}}
        );
    w.empty(
        "Relationship", {{"Id", "rId" + std::to_string(sheet_count + 1)}, {"Type", kStylesRel}, {"Target", "styles.xml"}}
    );
    w.end();
    return w.finish();
}

std::string styles_xml()
{
    XmlWriter w;
    w.start("styleSheet");
    w.attribute("xmlns", kMainNs);

    w.start("numFmts");
    w.attribute("count", "1");
    w.empty("numFmt", {{"numFmtId", std::to_string(kDateFormatId)}, {"formatCode", kDateFormat}});
    w.end();

    w.start("fonts");
    w.attribute("count", "1");
    w.start("font");
    w.empty("sz", {{"val", "11"}});
    w.empty("name", {{"val", "Calibri"}});
    w.end();
    w.end();

    w.start("fills");
    w.attribute("count", "2");
    for (const char* pattern : {"none", "gray125"})
    {
        w.start("fill");
        w.empty("patternFill", {{"patternType", pattern}});
        w.end();
    }
    w.end();

    w.start("borders");
    w.attribute("count", "1");
    w.start("border");
    for (const char* side : {"left", "right", "top", "bottom", "diagonal"})
        w.empty(side, {});
    w.end();
    w.end();

    w.start("cellStyleXfs");
    w.attribute("count", "1");
    w.empty("xf", {{"numFmtId", "0"}, {"fontId", "0"}, {"fillId", "0"}, {"borderId", "0"}});
    w.end();

    w.start("cellXfs");
    w.attribute("count", "2");
    w.empty("xf", {{"numFmtId", "0"}, {"fontId", "0"}, {"fillId", "0"}, {"borderId", "0"}, {"xfId", "0"}});
    w.empty(
        "xf",
        {{"numFmtId", std::to_string(kDateFormatId)},
         {"fontId", "0"},
         {"fillId", "0"},
         {"borderId", "0"},
         {"xfId", "0"},
         {"applyNumberFormat", "1"}}
    );
    w.end();

    w.start("cellStyles");
    w.attribute("count", "1");
    w.empty("cellStyle", {{"name", "Normal"}, {"xfId", "0"}, {"builtinId", "0"}});
    w.end();

    w.end();
    return w.finish();
}

std::string worksheet_xml(const Worksheet& sheet)
{
    XmlWriter w;
    w.start("worksheet");
    w.attribute("xmlns", kMainNs);
    w.start("sheetData");

    for (const auto& [row, cells] : sheet.rows())
    {
        w.start("row");
        w.attribute("r", std::to_string(row));
        for (const auto& [column, value] : cells)
        {
            std::string ref = column_name(column) + std::to_string(row);
            w.start("c");
            w.attribute("r", ref);
            if (const auto* s = std::get_if<std::string>(&value))
            {
                w.attribute("t", "inlineStr");
                w.start("is");
                w.start("t");
                w.attribute("xml:space", "preserve");
                w.text(*s);
                w.end();
                w.end();
            }
            else if (const auto* d = std::get_if<double>(&value))
            {
                w.start("v");
                w.text(format_number(*d, "%.17g"));
                w.end();
            }
            else if (const auto* dt = std::get_if<DateTime>(&value))
            {
                w.attribute("s", std::to_string(kDateStyleIndex));
                w.start("v");
                w.text(format_number(to_excel_serial(dt->time), "%.17g"));
                w.end();
            }
            w.end();
        }
        w.end();
    }

    w.end();
    w.end();
    return w.finish();
}

// =============================================================================
// XML reading
// =============================================================================

struct XmlDocDeleter
{
    void operator()(xmlDoc* doc) const
    {
        xmlFreeDoc(doc);
    }
};

using XmlDoc = std::unique_ptr<xmlDoc, XmlDocDeleter>;

XmlDoc parse_xml(const std::string& data, const std::string& part)
{
    xmlDoc* doc = xmlReadMemory(
        data.data(), static_cast<int>(data.size()), part.c_str(), nullptr, XML_PARSE_NONET | XML_PARSE_HUGE
    );
    if (!doc || !xmlDocGetRootElement(doc))
    {
        if (doc)
            xmlFreeDoc(doc);
        throw WorkbookError("Malformed XML in workbook part " + part);
    }
    return XmlDoc(doc);
}

bool is_element(const xmlNode* node, const char* name)
{
    return node->type == XML_ELEMENT_NODE && xmlStrEqual(node->name, BAD_CAST name);
}

xmlNode* first_child(xmlNode* parent, const char* name)
{
    for (xmlNode* n = parent ? parent->children : nullptr; n; n = n->next)
        if (is_element(n, name))
            return n;
    return nullptr;
}

/// Attribute by local name (namespace prefixes are ignored)
std::optional<std::string> attribute_of(xmlNode* node, const char* name)
{
    xmlChar* value = xmlGetProp(node, BAD_CAST name);
    if (!value)
        return std::nullopt;
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string content_of(xmlNode* node)
{
    xmlChar* value = xmlNodeGetContent(node);
    if (!value)
        return {};
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

/// Text of a string item: plain `<t>` or rich-text runs, without phonetic hints
std::string string_item_text(xmlNode* item)
{
    std::string text;
    for (xmlNode* n = item->children; n; n = n->next)
    {
        if (is_element(n, "t"))
            text += content_of(n);
        else if (is_element(n, "r"))
            if (xmlNode* t = first_child(n, "t"))
                text += content_of(t);
    }
    return text;
}

struct Relationship
{
    std::string type;
    std::string target;
};

std::map<std::string, Relationship> parse_relationships(const ZipReader& zip, const std::string& part)
{
    std::map<std::string, Relationship> rels;
    if (!zip.contains(part))
        return rels;

    XmlDoc doc = parse_xml(zip.read(part), part);
    for (xmlNode* n = xmlDocGetRootElement(doc.get())->children; n; n = n->next)
    {
        if (!is_element(n, "Relationship"))
            continue;
        auto id = attribute_of(n, "Id");
        auto target = attribute_of(n, "Target");
        if (id && target)
            rels[*id] = Relationship{attribute_of(n, "Type").value_or(""), *target};
    }
    return rels;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Resolve a relationship target against the directory of its source part
std::string resolve_part(const std::string& base_dir, const std::string& target)
{
    std::string combined = !target.empty() && target.front() == '/' ? target.substr(1) : base_dir + target;

    std::vector<std::string> segments;
    std::stringstream ss(combined);
    std::string segment;
    while (std::getline(ss, segment, '/'))
    {
        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..")
        {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string path;
    for (const auto& s : segments)
        path += (path.empty() ? "" : "/") + s;
    return path;
}

std::vector<std::string> read_shared_strings(const ZipReader& zip, const std::string& part)
{
    std::vector<std::string> strings;
    XmlDoc doc = parse_xml(zip.read(part), part);
    for (xmlNode* n = xmlDocGetRootElement(doc.get())->children; n; n = n->next)
        if (is_element(n, "si"))
            strings.push_back(string_item_text(n));
    return strings;
}

void read_worksheet(
    const ZipReader& zip, const std::string& part, const std::vector<std::string>& shared, Worksheet& sheet
)
{
    XmlDoc doc = parse_xml(zip.read(part), part);
    xmlNode* data = first_child(xmlDocGetRootElement(doc.get()), "sheetData");
    if (!data)
        return;

    size_t row = 0;
    for (xmlNode* r = data->children; r; r = r->next)
    {
        if (!is_element(r, "row"))
            continue;
        auto row_attr = attribute_of(r, "r");
        row = row_attr ? std::strtoull(row_attr->c_str(), nullptr, 10) : row + 1;

        size_t column = 0;
        for (xmlNode* c = r->children; c; c = c->next)
        {
            if (!is_element(c, "c"))
                continue;
            auto ref = attribute_of(c, "r");
            column = ref ? parse_reference(*ref).second : column + 1;
            if (row == 0 || column == 0)
                throw WorkbookError("Invalid cell reference in " + part);

            std::string type = attribute_of(c, "t").value_or("n");
            if (type == "inlineStr")
            {
                if (xmlNode* is = first_child(c, "is"))
                    sheet.set(row, column, string_item_text(is));
                continue;
            }

            xmlNode* v = first_child(c, "v");
            if (!v)
                continue;
            std::string raw = content_of(v);

            if (type == "s")
            {
                size_t index = std::strtoull(raw.c_str(), nullptr, 10);
                if (index >= shared.size())
                    throw WorkbookError("Shared string index out of range in " + part);
                sheet.set(row, column, shared[index]);
            }
            else if (type == "b")
            {
                sheet.set(row, column, std::string(raw == "1" ? "TRUE" : "FALSE"));
            }
            else if (type == "n")
            {
                char* end = nullptr;
                double number = std::strtod(raw.c_str(), &end);
                if (end == raw.c_str())
                    sheet.set(row, column, raw);
                else
                    sheet.set(row, column, number);
            }
            else
            {
                // str (formula result), e (error), d (ISO date)
                sheet.set(row, column, raw);
            }
        }
    }
}

} // namespace

// =============================================================================
// Dates
// =============================================================================

double to_excel_serial(std::chrono::system_clock::time_point time)
{
    using namespace std::chrono;

    std::time_t t = system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    auto date = sys_days{
        year{local.tm_year + 1900} / month{static_cast<unsigned>(local.tm_mon + 1)} /
        day{static_cast<unsigned>(local.tm_mday)}
    };
    auto days = (date - sys_days{year{1899} / December / 30}).count();

    double seconds = local.tm_hour * 3600.0 + local.tm_min * 60.0 + local.tm_sec;
    double fraction = duration<double>(time - system_clock::from_time_t(t)).count();
    if (fraction < 0.0 || fraction >= 1.0)
        fraction = 0.0;

    return static_cast<double>(days) + (seconds + fraction) / 86400.0;
}

// =============================================================================
// Worksheet
// =============================================================================

void Worksheet::set(size_t row, size_t column, CellValue value)
{
    if (row == 0 || column == 0)
        throw WorkbookError("Cell coordinates are 1-based");

    if (std::holds_alternative<std::monostate>(value))
    {
        auto it = rows_.find(row);
        if (it != rows_.end())
        {
            it->second.erase(column);
            if (it->second.empty())
                rows_.erase(it);
        }
        return;
    }
    rows_[row][column] = std::move(value);
}

const CellValue& Worksheet::get(size_t row, size_t column) const
{
    auto r = rows_.find(row);
    if (r == rows_.end())
        return kEmptyCell;
    auto c = r->second.find(column);
    return c == r->second.end() ? kEmptyCell : c->second;
}

std::string Worksheet::text(size_t row, size_t column) const
{
    const CellValue& value = get(row, column);
    if (const auto* s = std::get_if<std::string>(&value))
        return *s;
    if (const auto* d = std::get_if<double>(&value))
        return format_number(*d, "%.15g");
    if (const auto* dt = std::get_if<DateTime>(&value))
        return format_local_time(dt->time);
    return {};
}

size_t Worksheet::max_row() const
{
    return rows_.empty() ? 0 : rows_.rbegin()->first;
}

// =============================================================================
// Workbook
// =============================================================================

Worksheet& Workbook::add_worksheet(const std::string& name)
{
    if (name.empty() || name.size() > kMaxSheetName)
        throw WorkbookError("Worksheet names must be 1 to 31 characters: '" + name + "'");
    if (name.find_first_of("[]:*?/\\") != std::string::npos)
        throw WorkbookError("Invalid character in worksheet name: '" + name + "'");
    if (find_worksheet(name))
        throw WorkbookError("Duplicate worksheet name: '" + name + "'");

    sheets_.push_back(std::make_unique<Worksheet>(name));
    return *sheets_.back();
}

const Worksheet* Workbook::find_worksheet(const std::string& name) const
{
    for (const auto& sheet : sheets_)
        if (sheet->name() == name)
            return sheet.get();
    return nullptr;
}

const Worksheet& Workbook::worksheet(const std::string& name) const
{
    if (const Worksheet* sheet = find_worksheet(name))
        return *sheet;
    throw WorkbookError("Worksheet not found: '" + name + "'");
}

std::string Workbook::to_bytes() const
{
    if (sheets_.empty())
        throw WorkbookError("A workbook needs at least one worksheet");

    ZipWriter zip;
    zip.add("[Content_Types].xml", content_types_xml(sheets_.size()));
    zip.add("_rels/.rels", package_rels_xml());
    zip.add("xl/workbook.xml", workbook_xml(sheets_));
    zip.add("xl/_rels/workbook.xml.rels", workbook_rels_xml(sheets_.size()));
    zip.add("xl/styles.xml", styles_xml());
    for (size_t i = 0; i < sheets_.size(); ++i)
        zip.add("xl/worksheets/sheet" + std::to_string(i + 1) + ".xml", worksheet_xml(*sheets_[i]));
    return zip.finish();
}

void Workbook::save_as(const std::filesystem::path& path) const
{
    std::string bytes = to_bytes();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw WorkbookError("Cannot create workbook file: " + path.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
        throw WorkbookError("Failed to write workbook file: " + path.string());
}

Workbook Workbook::from_bytes(std::string data)
{
    ZipReader zip(std::move(data));

    std::string workbook_part = "xl/workbook.xml";
    for (const auto& [id, rel] : parse_relationships(zip, "_rels/.rels"))
        if (ends_with(rel.type, "/officeDocument"))
            workbook_part = resolve_part("", rel.target);
    if (!zip.contains(workbook_part))
        throw WorkbookError("Not an xlsx workbook (missing " + workbook_part + ")");

    size_t slash = workbook_part.rfind('/');
    std::string base_dir = slash == std::string::npos ? "" : workbook_part.substr(0, slash + 1);
    std::string file_name = workbook_part.substr(base_dir.size());
    auto rels = parse_relationships(zip, base_dir + "_rels/" + file_name + ".rels");

    std::vector<std::string> shared;
    for (const auto& [id, rel] : rels)
        if (ends_with(rel.type, "/sharedStrings"))
            shared = read_shared_strings(zip, resolve_part(base_dir, rel.target));

    Workbook book;
    XmlDoc doc = parse_xml(zip.read(workbook_part), workbook_part);
    xmlNode* sheets = first_child(xmlDocGetRootElement(doc.get()), "sheets");
    for (xmlNode* n = sheets ? sheets->children : nullptr; n; n = n->next)
    {
        if (!is_element(n, "sheet"))
            continue;
        auto name = attribute_of(n, "name");
        auto rel_id = attribute_of(n, "id");
        if (!name || !rel_id)
            throw WorkbookError("Sheet entry without name or relationship id");
        auto rel = rels.find(*rel_id);
        if (rel == rels.end())
            throw WorkbookError("Missing relationship for sheet '" + *name + "'");

        auto sheet = std::make_unique<Worksheet>(*name);
        read_worksheet(zip, resolve_part(base_dir, rel->second.target), shared, *sheet);
        book.sheets_.push_back(std::move(sheet));
    }
    return book;
}

Workbook Workbook::load(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw WorkbookError("Cannot open workbook file: " + path.string());
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return from_bytes(std::move(data));
}

} // namespace chatconsole::xlsx
