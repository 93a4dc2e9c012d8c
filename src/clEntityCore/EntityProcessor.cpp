
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "EntityProcessor.h"
#include "EntityBuilder.h"
#include "Logging.h"
#include "Validator.h"

#include <stdexcept>


namespace
{
	void AddCandidate(std::vector<const clent::TypeDecl*>& candidates, std::set<std::string>& added, const clent::TypeDecl* type)
	{
		if (added.insert(type->name).second)
			candidates.push_back(type);
	}


	void ReportFailure(clent::ProcessingContext& ctx, const clent::TypeDecl& type, clent::DiagnosticCode code, const std::string& message)
	{
		LOG(build, ERROR, "%s(%d) : %s\n", type.filename.c_str(), type.line, message.c_str());

		clent::Diagnostic diag;
		diag.severity = clent::SEVERITY_ERROR;
		diag.code = code;
		diag.message = message;
		diag.subject = type.name;
		diag.filename = type.filename;
		diag.line = type.line;
		ctx.AddDiagnostic(diag);
		ctx.MarkInvalid(type.name);
	}


	void BuildAll(clent::ProcessingContext& ctx, const std::vector<const clent::TypeDecl*>& types, clent::EntityKind kind)
	{
		for (size_t i = 0; i < types.size(); i++)
		{
			const clent::TypeDecl& type = *types[i];

			// Don't let one bad declaration take the rest of the run down with it
			clent::EntityDescriptor entity;
			clent::Status status;
			try
			{
				status = clent::BuildEntity(ctx, type, kind, entity);
			}
			catch (const std::exception& e)
			{
				status = clent::Status::Fail(clent::DIAG_INTERNAL_FAILURE, std::string("Internal failure building '") + type.name + "': " + e.what());
			}

			if (status.HasFailed())
			{
				ReportFailure(ctx, type, status.code, status.message);
				continue;
			}

			if (!ctx.AddDescriptor(entity))
				LOG(build, WARNING, "%s(%d) : %s '%s' has already been built\n", type.filename.c_str(), type.line, clent::GetEntityKindName(kind), type.name.c_str());
		}
	}
}


clent::Candidates clent::CollectCandidates(const DeclarationAdapter& adapter, const AnnotationCatalog& catalog)
{
	Candidates candidates;
	std::set<std::string> entities, superclasses, embeddables;

	std::vector<const TypeDecl*> types = adapter.GetTypes();
	for (size_t i = 0; i < types.size(); i++)
	{
		const TypeDecl* type = types[i];
		const AnnotationList& annotations = adapter.AnnotationsOf(*type);
		if (catalog.Has(annotations, ANNOTATION_ENTITY))
			AddCandidate(candidates.entities, entities, type);
		if (catalog.Has(annotations, ANNOTATION_SUPERCLASS))
			AddCandidate(candidates.superclasses, superclasses, type);
		if (catalog.Has(annotations, ANNOTATION_EMBEDDABLE))
			AddCandidate(candidates.embeddables, embeddables, type);
	}

	return candidates;
}


clent::ProcessResult clent::Process(const DeclarationAdapter& adapter, const ProcessingOptions& options)
{
	ProcessingContext ctx(adapter, options);

	Candidates candidates = CollectCandidates(adapter, ctx.GetCatalog());
	LOG(main, INFO, "Found %d entities, %d superclasses, %d embeddables\n",
		(int)candidates.entities.size(), (int)candidates.superclasses.size(), (int)candidates.embeddables.size());

	BuildAll(ctx, candidates.superclasses, KIND_SUPERCLASS);
	BuildAll(ctx, candidates.embeddables, KIND_EMBEDDABLE);
	BuildAll(ctx, candidates.entities, KIND_ENTITY);

	ProcessResult result;
	result.graph.reset(new EntityGraph());
	AssembleGraph(ctx, *result.graph);

	result.diagnostics = ctx.GetDiagnostics();
	DiagnosticList findings = ValidateGraph(*result.graph);
	result.diagnostics.insert(result.diagnostics.end(), findings.begin(), findings.end());
	result.invalid = ctx.GetInvalid();

	return result;
}
