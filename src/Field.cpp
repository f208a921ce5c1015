#include <boost/spirit/include/qi.hpp>

#include "ipgeo/Field.hpp"

namespace ipgeo {
namespace qi    = boost::spirit::qi;
namespace ascii = boost::spirit::ascii;

static const char *const kFieldNames[kFieldCount] = {
    "country_short",      "country_long", "region",    "city",
    "isp",                "latitude",     "longitude", "domain",
    "zipcode",            "timezone",     "netspeed",  "iddcode",
    "areacode",           "weatherstationcode",        "weatherstationname",
    "mcc",                "mnc",          "mobilebrand", "elevation",
    "usagetype",
};

const char *FieldName(Field field) { return kFieldNames[Index(field)]; }

struct FieldSymbols : qi::symbols<char, uint32_t> {
  FieldSymbols() {
    for (int i = 0; i < kFieldCount; ++i) {
      add(kFieldNames[i], Mask(FieldAt(i)));
    }
    add("all", kAllFields);
  }
};

template <typename Iterator = std::string::const_iterator>
struct FieldsGrammar
    : qi::grammar<Iterator, std::vector<uint32_t>(), ascii::space_type> {
  FieldsGrammar() : FieldsGrammar::base_type(fields) {
    using namespace qi;

    // symbols match the longest name, so "country" alone does not parse
    name   = lexeme[names >> !char_("a-z_")];
    fields = name % ',';
  }

private:
  FieldSymbols names;
  qi::rule<Iterator, uint32_t(), ascii::space_type> name;
  qi::rule<Iterator, std::vector<uint32_t>(), ascii::space_type> fields;
};

bool ParseFields(const std::string &text, uint32_t &mask) {
  static const FieldsGrammar<> g;

  std::vector<uint32_t> masks;
  auto begin = text.cbegin();
  auto end   = text.cend();
  bool ok    = qi::phrase_parse(begin, end, g, ascii::space, masks);
  if (!ok || begin != end) {
    return false;
  }

  uint32_t result = 0;
  for (auto m : masks) {
    result |= m;
  }
  mask = result;
  return true;
}

} // namespace ipgeo
