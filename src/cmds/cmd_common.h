#pragma once

#include "install_store.h"
#include "repo_index.h"

#include <vector>

namespace anvil {

void print_index_entries(std::vector<index_entry> const &entries);
void print_receipt(receipt const &r);

}  // namespace anvil
