
//
// ===============================================================================
// clEntity, PropertyExtractor.h - Derives a property descriptor from a single
// field or accessor declaration.
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
	// "getEmailAddress" -> "emailAddress", "isActive" -> "active". Returns an empty string
	// for methods that aren't accessors.
	//
	std::string PropertyNameFromAccessor(const std::string& method_name);


	//
	// Returns Ok with a filled descriptor, Skip for members that aren't properties, or a
	// failure when an annotation references a type that can't be resolved. The owner
	// needs its names, interface and immutability flags set before calling. Doesn't
	// report diagnostics itself.
	//
	Status ExtractProperty(const ProcessingContext& ctx, const EntityDescriptor& owner, const MemberDecl& member, PropertyDescriptor& property);
}
