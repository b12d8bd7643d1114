#pragma once

#include "trellis/db_commands/db_commands_plugin.hpp"
#include "trellis/db_commands/db_info_tab.hpp"
#include "trellis/db_commands/edit_table_tab.hpp"
