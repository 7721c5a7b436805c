#pragma once

#include <cstdint>
#include <string>

struct Options {
  std::string unlocking;  // Unlocking script, in hex.
  std::string locking;    // Locking script of the spent output, in hex.
  std::string tx;         // Serialized spending transaction, in hex.
  int input = 0;          // Index of the input to verify.
  int64_t amount = 0;     // Value of the spent output, in satoshis.
  bool trace = false;     // Print each execution step.
  std::string logfile;    // Appends log output to this file.
  bool quiet = false;     // Suppresses log output on stdout.
};
