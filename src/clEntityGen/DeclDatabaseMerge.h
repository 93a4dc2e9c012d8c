
//
// ===============================================================================
// clEntity, DeclDatabaseMerge.h - Merging of declaration databases scanned from
// separate translation units.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


namespace clent
{
	class DeclDatabase;


	//
	// Adds the types of the source database that the destination doesn't have yet. Types are
	// unique by qualified name and the first definition wins; a later one with a different
	// number of members is reported as a warning against the given source filename.
	//
	void MergeDeclDatabases(DeclDatabase& dest_db, const DeclDatabase& src_db, const char* src_filename);
}
