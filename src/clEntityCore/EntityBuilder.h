
//
// ===============================================================================
// clEntity, EntityBuilder.h - Builds entity descriptors from type declarations,
// merging properties inherited from superclasses and embeddables.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#pragma once


#include "Descriptors.h"
#include "Status.h"


namespace clent
{
	class ProcessingContext;


	//
	// Builds the descriptor of a single type. Inherited properties are only merged for
	// entities and are looked up in the superclass and embeddable maps of the context, so
	// those need building first. No cross-entity validation is done here.
	//
	Status BuildEntity(const ProcessingContext& ctx, const TypeDecl& type, EntityKind kind, EntityDescriptor& entity);


	// Table name used when none is given explicitly
	std::string DefaultTableName(const EntityDescriptor& entity, const std::vector<std::string>& class_prefixes);
}
