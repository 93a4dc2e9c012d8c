
//
// ===============================================================================
// clEntity, DeclDatabaseTextSerialiser.h - Human-readable text serialisation of
// declaration databases.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


namespace clent
{
	class DeclDatabase;

	bool WriteDeclDatabase(const char* filename, const DeclDatabase& db);

	// Tables are read in whatever order they arrive. Expects an empty database, use MergeDeclDatabases to combine files.
	bool ReadDeclDatabase(const char* filename, DeclDatabase& db);

	// Checks the header and format version
	bool IsDeclDatabase(const char* filename);
}
