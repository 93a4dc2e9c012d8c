
//
// ===============================================================================
// clEntity, EntityProcessor.h - Runs candidate collection, building, assembly
// and validation over a set of declarations.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "Diagnostics.h"
#include "EntityGraph.h"
#include "ProcessingContext.h"

#include <memory>
#include <set>
#include <string>
#include <vector>


namespace clent
{
	class AnnotationCatalog;
	class DeclarationAdapter;


	// Marked declarations for each kind, de-duplicated and in declaration order
	struct Candidates
	{
		std::vector<const TypeDecl*> entities;
		std::vector<const TypeDecl*> superclasses;
		std::vector<const TypeDecl*> embeddables;
	};


	Candidates CollectCandidates(const DeclarationAdapter& adapter, const AnnotationCatalog& catalog);


	struct ProcessResult
	{
		std::unique_ptr<EntityGraph> graph;

		// Build failures followed by validation findings
		DiagnosticList diagnostics;

		// Declarations that failed to build and aren't in the graph
		std::set<std::string> invalid;
	};


	//
	// A complete run: superclasses and embeddables are built first so that entities can
	// inherit from them. A declaration that fails is recorded as invalid and the run
	// continues without it. Always returns a frozen graph.
	//
	ProcessResult Process(const DeclarationAdapter& adapter, const ProcessingOptions& options);
}
