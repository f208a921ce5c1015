#include <iostream>
#include "ipgeo/Field.hpp"
#include "ipgeo/Option.hpp"

namespace ipgeo {

static std::string fieldList() {
  std::string list = "all";
  for (int i = 0; i < kFieldCount; ++i) {
    list += ", ";
    list += FieldName(FieldAt(i));
  }
  return list;
}

void ParseOption(int argc, char *argv[], Option &opt) {
  using namespace boost::program_options;
  try {
    options_description desc("Usage: ipgeo-lookup -d <db> [options] [ip...]");
    // clang-format off
    desc.add_options()
      ("help,h", "print usage message")
      ("db,d", value(&opt.db_path_)->required(), "database path")
      ("fields,f", value(&opt.fields_)->default_value("all"), "comma separated fields to decode")
      ("json,j", bool_switch(&opt.json_), "print one JSON object per address")
      ("meta,m", bool_switch(&opt.meta_), "print database metadata")
      ("verbose,v", bool_switch(&opt.verbose_), "debug logging");
    // clang-format on

    options_description hidden;
    hidden.add_options()("ip", value(&opt.addresses_), "addresses");

    options_description all;
    all.add(desc).add(hidden);

    positional_options_description pos;
    pos.add("ip", -1);

    variables_map vm;
    store(command_line_parser(argc, argv).options(all).positional(pos).run(),
          vm);

    if (vm.count("help")) {
      std::cout << desc << std::endl;
      std::cout << "fields: " << fieldList() << std::endl;
      exit(0);
    }

    notify(vm);

    if (!ParseFields(opt.fields_, opt.mask_)) {
      throw std::logic_error("invalid field list '" + opt.fields_ +
                             "', expected: " + fieldList());
    }
  } catch (std::exception &e) {
    std::cerr << e.what() << std::endl;
    exit(1);
  }
}

} // namespace ipgeo
