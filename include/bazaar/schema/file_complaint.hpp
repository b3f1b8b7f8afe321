#pragma once
#include <bazaar/schema/primitives.hpp>
#include <string>

// Schema type: file complaint.
// Marketplace workflow: opens a dispute once the deadline has passed without
// a confirmation. Filed by the selected consumer or the supplier.
namespace bazaar::schema {

template <uint16_t Version>
struct file_complaint;

template <>
struct file_complaint<1> final {
  uint16_t version{1};
  object_id_t product_id{};
  std::string reason;
};

using file_complaint_t = file_complaint<1>;

}  // namespace bazaar::schema
