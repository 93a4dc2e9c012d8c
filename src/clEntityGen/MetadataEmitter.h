
//
// ===============================================================================
// clEntity, MetadataEmitter.h - Generates entity implementations, metadata
// descriptors and per-package model registries from a built graph.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "CodeGen.h"

#include <string>
#include <vector>


namespace clent
{
	class EntityGraph;
	struct EntityDescriptor;
	struct ProcessingOptions;
	struct PropertyDescriptor;


	//
	// Generates, for each descriptor in the graph:
	//
	//    <package>/Generated<Simple>.h    Implementation of mutable entities
	//    <package>/<Simple>_.h/.cpp       Metadata singleton for every kind
	//    <package>/Models.h/.cpp          Registry of the package's entities
	//
	// Generated files include each other relative to the output directory, which needs to
	// be on the include path of whatever compiles them. Output is ordered by path.
	//
	std::vector<GeneratedFile> EmitGraph(const EntityGraph& graph, const ProcessingOptions& options);


	// "emailAddress" -> "EMAIL_ADDRESS"
	std::string GetAttributeName(const std::string& property_name);

	// Accessor names in the style of the owning entity; the setter is empty for read-only properties
	std::string GetGetterName(const EntityDescriptor& entity, const PropertyDescriptor& property);
	std::string GetSetterName(const EntityDescriptor& entity, const PropertyDescriptor& property);

	// Name within the package, "model::Outer::Inner" in "model" -> "Outer_Inner"
	std::string GetLocalName(const EntityDescriptor& entity);

	// Class name of the generated implementation
	std::string GetImplementationName(const EntityDescriptor& entity);
}
