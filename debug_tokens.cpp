#include <spool_json/spool_json.hpp>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>

using namespace spool::json;

// Prints the token stream of a JSON document, one token per line:
//   BEGIN_OBJECT      $.
//   NAME "id"         $.id
//   NUMBER 42         $.id
//
// Usage: spool_debug_tokens [--lenient] [file]   (stdin if no file)
static void dump_tokens(JsonReader &reader) {
  while (true) {
    Token token = reader.peek();
    std::string text;
    switch (token) {
    case Token::BeginArray:
      reader.begin_array();
      break;
    case Token::EndArray:
      reader.end_array();
      break;
    case Token::BeginObject:
      reader.begin_object();
      break;
    case Token::EndObject:
      reader.end_object();
      break;
    case Token::Name:
      text = detail::quoted(reader.next_name());
      break;
    case Token::String:
      text = detail::quoted(reader.next_string());
      break;
    case Token::Number:
      text = reader.next_string();
      break;
    case Token::Boolean:
      text = reader.next_boolean() ? "true" : "false";
      break;
    case Token::Null:
      reader.next_null();
      text = "null";
      break;
    case Token::EndDocument:
      std::cout << token << "\n";
      return;
    }

    std::string line = to_string(token);
    if (!text.empty())
      line += " " + text;
    if (line.size() < 24)
      line.resize(24, ' ');
    std::cout << line << " " << reader.get_path() << "\n";
  }
}

int main(int argc, char **argv) {
  ReaderOptions options;
  const char *path = nullptr;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--lenient") == 0) {
      options.lenient = true;
    } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      std::cerr << "Usage: " << argv[0] << " [--lenient] [file]\n";
      return 2;
    } else {
      path = argv[i];
    }
  }

  std::ifstream file;
  if (path && std::strcmp(path, "-") != 0) {
    file.open(path, std::ios::binary);
    if (!file.is_open()) {
      std::cerr << "Failed to open file: " << path << "\n";
      return 1;
    }
  }
  std::istream &in = file.is_open() ? static_cast<std::istream &>(file)
                                    : std::cin;

  auto reader = JsonReader::of(in, options);
  try {
    dump_tokens(*reader);
  } catch (const EncodingError &e) {
    std::cerr << e.format() << "\n";
    return 1;
  } catch (const JsonError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::logic_error &e) {
    std::cerr << "Reader misuse: " << e.what() << "\n";
    return 1;
  }
  reader->close();
  return 0;
}
