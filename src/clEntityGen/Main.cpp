
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "DeclDatabaseMerge.h"
#include "MetadataEmitter.h"

#include <clEntityCore/Arguments.h>
#include <clEntityCore/DeclDatabase.h>
#include <clEntityCore/DeclDatabaseTextSerialiser.h>
#include <clEntityCore/EntityProcessor.h>
#include <clEntityCore/GraphTextSerialiser.h>
#include <clEntityCore/Logging.h>


namespace
{
	void PrintUsage()
	{
		LOG(main, INFO, "clentgen [options] <decl files...>\n");
		LOG(main, INFO, "   -output <dir>            Directory to write generated files to\n");
		LOG(main, INFO, "   -strict                  Don't generate anything if there are errors\n");
		LOG(main, INFO, "   -generate_jpa 0/1        Accept the standard persistence annotations\n");
		LOG(main, INFO, "   -generate_model 0/1      Generate the per-package model registry\n");
		LOG(main, INFO, "   -generate_always 0/1     Generate even if there are errors\n");
		LOG(main, INFO, "   -class_prefix <prefix>   Strip from default table names, repeatable\n");
		LOG(main, INFO, "   -graph_log <file>        Write the built entity graph to a file\n");
	}


	clent::ProcessingOptions GetOptions(const Arguments& args)
	{
		clent::ProcessingOptions options;
		options.generate_jpa = args.GetBoolProperty("-generate_jpa", options.generate_jpa);
		options.generate_model = args.GetBoolProperty("-generate_model", options.generate_model);
		options.generate_always = args.GetBoolProperty("-generate_always", options.generate_always);
		if (args.Have("-strict"))
			options.generate_always = false;

		// Any given prefixes replace the defaults
		std::vector<std::string> prefixes = args.GetProperties("-class_prefix");
		if (!prefixes.empty())
			options.class_prefixes = prefixes;

		return options;
	}


	bool LoadDeclarations(const std::vector<std::string>& filenames, clent::DeclDatabase& db)
	{
		for (size_t i = 0; i < filenames.size(); i++)
		{
			const char* filename = filenames[i].c_str();

			clent::DeclDatabase loaded_db;
			if (!clent::ReadDeclDatabase(filename, loaded_db))
			{
				LOG(main, ERROR, "Couldn't read '%s' as a declaration database - does it exist?\n", filename);
				return false;
			}

			LOG(main, INFO, "Loaded %d types from %s\n", (int)loaded_db.GetNbTypes(), filename);
			clent::MergeDeclDatabases(db, loaded_db, filename);
		}

		return true;
	}
}


int main(int argc, const char* argv[])
{
	LOG_TO_STDOUT(main, ALL);
	LOG_TO_STDOUT(diag, ALL);
	LOG_TO_STDOUT(warnings, ALL);

	Arguments args(argc, argv);
	std::vector<std::string> switches;
	switches.push_back("-strict");
	std::vector<std::string> filenames = args.GetPositionals(switches);
	if (filenames.empty())
	{
		LOG(main, ERROR, "No declaration files specified\n");
		PrintUsage();
		return 1;
	}

	clent::DeclDatabase db;
	if (!LoadDeclarations(filenames, db))
		return 1;

	clent::ProcessingOptions options = GetOptions(args);
	clent::ProcessResult result = clent::Process(db, options);

	std::string graph_log = args.GetProperty("-graph_log");
	if (graph_log != "" && !clent::WriteGraphText(graph_log.c_str(), *result.graph))
		LOG(main, WARNING, "Couldn't write graph log '%s'\n", graph_log.c_str());

	clent::PrintDiagnostics(result.diagnostics);
	bool has_errors = clent::HasErrors(result.diagnostics);

	std::string output = args.GetProperty("-output");
	if (has_errors && !options.generate_always)
	{
		LOG(main, INFO, "Nothing generated as there were errors\n");
	}
	else if (output != "")
	{
		std::vector<clent::GeneratedFile> files = clent::EmitGraph(*result.graph, options);
		if (!clent::WriteGeneratedFiles(output, files))
			return 1;
	}

	return has_errors ? 1 : 0;
}
