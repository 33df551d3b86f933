#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "expat.h"

class ContainerParser final {
  enum ParserState {
    START,
    IN_CONTAINER,
    IN_ROOTFILES,
  };

  size_t remainingSize;
  XML_Parser parser = nullptr;
  ParserState state = START;

  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL endElement(void* userData, const XML_Char* name);

  void cleanup();

 public:
  // First rootfile full-path, empty when none was declared
  std::string fullPath;

  explicit ContainerParser(const size_t xmlSize) : remainingSize(xmlSize) {}
  ~ContainerParser();

  ContainerParser(const ContainerParser&) = delete;
  ContainerParser& operator=(const ContainerParser&) = delete;

  bool setup();

  // Returns the number of bytes consumed, 0 on a parse error
  size_t write(const uint8_t* buffer, size_t size);
};
