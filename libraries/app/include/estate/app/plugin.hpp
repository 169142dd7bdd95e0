/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <estate/chain/database.hpp>

#include <boost/program_options.hpp>

#include <string>

namespace estate { namespace app {

/**
 * An optional component that observes a database, configured through program options
 *
 * The owner of the database calls, in order: plugin_set_program_options(), plugin_initialize()
 * with the parsed options, plugin_startup(), and finally plugin_shutdown().
 */
class abstract_plugin
{
   public:
      virtual ~abstract_plugin(){}
      virtual std::string plugin_name()const = 0;
      virtual std::string plugin_description()const = 0;

      /**
       * @brief Read the options and connect to the database signals
       * @param options Parsed command-line or configuration options
       */
      virtual void plugin_initialize( const boost::program_options::variables_map& options ) = 0;

      /// Called once initialization is complete and the database may be read
      virtual void plugin_startup() = 0;

      /// Disconnect from the database.  Nothing is delivered to the plugin afterwards.
      virtual void plugin_shutdown() = 0;

      /**
       * @brief Add the options the plugin accepts
       * @param command_line_options Options taken on the command line
       * @param config_file_options Options taken from a configuration file
       */
      virtual void plugin_set_program_options(
         boost::program_options::options_description& command_line_options,
         boost::program_options::options_description& config_file_options
         ) = 0;
};

/**
 * Empty default implementations of abstract_plugin, bound to one database
 */
class plugin : public abstract_plugin
{
   public:
      explicit plugin( chain::database& db ) : _db( db ) {}
      ~plugin() override = default;

      std::string plugin_name()const override { return "<unknown plugin>"; }
      std::string plugin_description()const override { return "<no description>"; }
      void plugin_initialize( const boost::program_options::variables_map& options ) override {}
      void plugin_startup() override {}
      void plugin_shutdown() override {}
      void plugin_set_program_options(
         boost::program_options::options_description& command_line_options,
         boost::program_options::options_description& config_file_options
         ) override {}

      chain::database& database() { return _db; }
      const chain::database& database()const { return _db; }

   private:
      chain::database& _db;
};

} } //estate::app
