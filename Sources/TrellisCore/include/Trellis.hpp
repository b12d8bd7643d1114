#pragma once

// Trellis - plugin runtime with generated SQLite row mapping
//
// Usage:
//   #include <Trellis.hpp>
//
//   struct client {
//       std::string name;
//   };
//   TRELLIS_TABLE(client, name)
//
//   struct clients_plugin : trellis::plugin {
//       void build(trellis::context& ctx) override {
//           ctx.add_table<client>("client");
//       }
//   };
//
//   int main() {
//       trellis::context ctx;
//       ctx.in_memory_db(true);
//       ctx.add_plugin<clients_plugin>();
//       ctx.startup();
//       auto id = ctx.connection().new_row_in_table("client");
//       ctx.connection().set_field_in_table("client", id, "name", std::string("Ann"));
//   }

#include "trellis/types.hpp"
#include "trellis/log.hpp"
#include "trellis/error.hpp"
#include "trellis/resources.hpp"
#include "trellis/table_field.hpp"
#include "trellis/table_builder.hpp"
#include "trellis/db.hpp"
#include "trellis/db_connection.hpp"
#include "trellis/schema.hpp"
#include "trellis/command.hpp"
#include "trellis/config.hpp"
#include "trellis/context.hpp"
