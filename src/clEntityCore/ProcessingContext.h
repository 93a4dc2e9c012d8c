
//
// ===============================================================================
// clEntity, ProcessingContext.h - Options and lookup state for a single
// processing run.
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//


#pragma once


#include "AnnotationCatalog.h"
#include "Descriptors.h"
#include "Diagnostics.h"

#include <map>
#include <set>
#include <string>
#include <vector>


namespace clent
{
	class DeclarationAdapter;


	struct ProcessingOptions
	{
		ProcessingOptions()
			: generate_jpa(true)
			, generate_model(true)
			, generate_always(true)
		{
			class_prefixes.push_back("Abstract");
			class_prefixes.push_back("Base");
		}

		// Accept the standard persistence dialect
		bool generate_jpa;

		// Emit the per-package model registry
		bool generate_model;

		// Emit even when errors have been reported
		bool generate_always;

		// Stripped from class names when deriving default table names
		std::vector<std::string> class_prefixes;
	};


	typedef std::map<std::string, EntityDescriptor> EntityMap;


	//
	// Created at the start of a run and passed to every stage. The three descriptor maps are
	// written once per qualified name and read by later stages.
	//
	class ProcessingContext
	{
	public:
		ProcessingContext(const DeclarationAdapter& adapter, const ProcessingOptions& options);

		const DeclarationAdapter& GetAdapter() const { return m_Adapter; }
		const ProcessingOptions& GetOptions() const { return m_Options; }
		const AnnotationCatalog& GetCatalog() const { return m_Catalog; }

		const EntityMap& GetDescriptors(EntityKind kind) const;
		const EntityDescriptor* FindDescriptor(EntityKind kind, const std::string& qualified_name) const;

		// Returns false without modifying anything if the name has already been added for its kind
		bool AddDescriptor(const EntityDescriptor& descriptor);

		void MarkInvalid(const std::string& qualified_name);
		bool IsInvalid(const std::string& qualified_name) const;
		const std::set<std::string>& GetInvalid() const { return m_Invalid; }

		void AddDiagnostic(const Diagnostic& diagnostic) { m_Diagnostics.push_back(diagnostic); }
		const DiagnosticList& GetDiagnostics() const { return m_Diagnostics; }

	private:
		EntityMap& GetMap(EntityKind kind);

		const DeclarationAdapter& m_Adapter;
		ProcessingOptions m_Options;
		AnnotationCatalog m_Catalog;

		EntityMap m_Superclasses;
		EntityMap m_Embeddables;
		EntityMap m_Entities;

		std::set<std::string> m_Invalid;
		DiagnosticList m_Diagnostics;
	};
}
