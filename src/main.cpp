#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "invoicer/calculator.hpp"
#include "invoicer/input_locator.hpp"
#include "invoicer/loader.hpp"
#include "invoicer/report.hpp"

static void print_usage(std::ostream& os) {
  os << "Usage:\n"
     << "  invoicer bill [--file <path>] [--format text|json] [--out <path>]\n"
     << "  invoicer --help\n"
     << "  invoicer --version\n"
     << "\n"
     << "Options:\n"
     << "  --file <path>           Input JSON usage file (an array of records).\n"
     << "                          Default: ../usage-data.json next to the binary,\n"
     << "                          then ./usage-data.json.\n"
     << "  --format text|json      Output format (default text).\n"
     << "  --out <path>            Write output to file instead of stdout.\n"
     << "  --help                  Print this help.\n"
     << "  --version               Print version.\n"
     << "\n"
     << "Examples:\n"
     << "  invoicer bill\n"
     << "  invoicer bill --file usage-data.json\n"
     << "  invoicer bill --file usage-data.json --format json --out invoices.json\n";
}

static int run(int argc, char** argv) {
  // Global flags
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(std::cout);
      return 0;
    }
    if (a == "--version") {
      std::cout << "invoicer v" << invoicer::kVersion << "\n";
      return 0;
    }
  }

  // Must have a command
  if (argc < 2) {
    print_usage(std::cout);
    return 1;
  }

  std::string cmd = argv[1];
  if (cmd != "bill") {
    print_usage(std::cout);
    return 1;
  }

  std::string file_path;
  std::string format = "text";
  std::string out_path;

  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];

    if (a == "--file" && i + 1 < argc) {
      file_path = argv[++i];
      continue;
    }

    if (a == "--format" && i + 1 < argc) {
      format = argv[++i];
      if (format != "text" && format != "json") {
        std::cerr << "Invalid --format. Use: text or json\n";
        return 1;
      }
      continue;
    }

    if (a == "--out" && i + 1 < argc) {
      out_path = argv[++i];
      continue;
    }

    // bare path, same as --file
    if (!a.empty() && a[0] != '-' && file_path.empty()) {
      file_path = a;
      continue;
    }

    std::cerr << "Unknown argument: " << a << "\n";
    print_usage(std::cerr);
    return 1;
  }

  const std::string input_path = invoicer::resolve_input_path(file_path, argv[0]);

  invoicer::LoadResult loaded;
  std::string err;
  if (!invoicer::load_usage_file(input_path, loaded, &err)) {
    std::cerr << "Error: " << err << "\n";
    return 1;
  }

  const invoicer::InvoiceCalculator calc(invoicer::PricingSchedule::standard());

  std::vector<invoicer::BilledRecord> billed;
  billed.reserve(loaded.valid.size());
  for (const auto& r : loaded.valid) {
    billed.push_back({r, calc.calculate(r)});
  }

  // Decide output stream
  std::ofstream fout;
  std::ostream* out = &std::cout;

  if (!out_path.empty()) {
    fout.open(out_path, std::ios::out | std::ios::trunc);
    if (!fout) {
      std::cerr << "Error: Failed to open output file: " << out_path << "\n";
      return 1;
    }
    out = &fout;
  }

  if (format == "json") {
    invoicer::write_json_report(*out, billed, loaded.rejected);
  } else {
    invoicer::write_text_report(*out, billed, loaded.rejected);
  }

  out->flush();
  if (!*out) {
    std::cerr << "Error: Failed to write report\n";
    return 1;
  }

  return 0;
}

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
  }
}
