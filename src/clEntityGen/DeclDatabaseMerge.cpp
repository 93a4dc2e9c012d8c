
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "DeclDatabaseMerge.h"

#include <clEntityCore/DeclDatabase.h>
#include <clEntityCore/Logging.h>


void clent::MergeDeclDatabases(DeclDatabase& dest_db, const DeclDatabase& src_db, const char* src_filename)
{
	std::vector<const TypeDecl*> types = src_db.GetTypes();
	for (size_t i = 0; i < types.size(); i++)
	{
		const TypeDecl& src_type = *types[i];

		const TypeDecl* dest_type = dest_db.FindType(src_type.name);
		if (dest_type == 0)
		{
			dest_db.AddType(src_type.name) = src_type;
			continue;
		}

		// This has to be the same type included in multiple translation units
		// Ensure that their descriptions match up as best as possible at this point
		if (dest_type->members.size() != src_type.members.size())
		{
			LOG(main, WARNING, "Type %s differs in member count during merge (source file %s)\n",
				src_type.name.c_str(), src_filename);
		}
	}
}
