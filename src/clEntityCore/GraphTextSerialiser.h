
//
// ===============================================================================
// clEntity, GraphTextSerialiser.h - Ruled text dump of a built entity graph.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include <string>


namespace clent
{
	class EntityGraph;

	// Identical graphs give identical text
	std::string GraphToText(const EntityGraph& graph);

	bool WriteGraphText(const char* filename, const EntityGraph& graph);
}
