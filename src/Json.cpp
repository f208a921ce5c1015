#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"

#include "ipgeo/Json.hpp"

namespace ipgeo {
namespace json {
using namespace rapidjson;

static void string_handler(Document &doc, const char *k, const std::string &v) {
  Value key(k, doc.GetAllocator());
  Value val(v.c_str(), static_cast<SizeType>(v.size()), doc.GetAllocator());
  doc.AddMember(key.Move(), val.Move(), doc.GetAllocator());
}

static void double_handler(Document &doc, const char *k, double v) {
  Value key(k, doc.GetAllocator()), val;
  val.SetDouble(v);
  doc.AddMember(key.Move(), val.Move(), doc.GetAllocator());
}

void PopulateJsonDoc(Document *doc, const std::string &ip, const Record &record,
                     uint32_t mask) {
  doc->SetObject();
  string_handler(*doc, "ip", ip);

  for (int i = 0; i < kFieldCount; ++i) {
    Field field = FieldAt(i);
    if (!Requested(mask, field)) {
      continue;
    }
    if (IsNumeric(field)) {
      double_handler(*doc, FieldName(field), *record.Number(field));
    } else {
      string_handler(*doc, FieldName(field), *record.String(field));
    }
  }
}

std::string ToJsonString(const std::string &ip, const Record &record,
                         uint32_t mask) {
  Document doc;
  PopulateJsonDoc(&doc, ip, record, mask);

  StringBuffer sb;
  Writer<StringBuffer> writer(sb);
  doc.Accept(writer);
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace json
} // namespace ipgeo
