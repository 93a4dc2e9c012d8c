
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "ASTConsumer.h"
#include "ContainerSpecs.h"

#include <clEntityCore/DeclDatabase.h>
#include <clEntityCore/DeclDatabaseTextSerialiser.h>
#include <clEntityCore/Logging.h>

#include <clang/AST/ASTConsumer.h>
#include <clang/AST/ASTContext.h>
#include <clang/Frontend/FrontendAction.h>
#include <clang/Tooling/CommonOptionsParser.h>
#include <clang/Tooling/CompilationDatabase.h>
#include <clang/Tooling/Tooling.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>

#include <functional>
#include <stdio.h>
#include <time.h>


namespace
{
	using ParseTUHandler = std::function<void(clang::ASTContext&, clang::TranslationUnitDecl*)>;


	// Top-level AST consumer that passes an entire TU to the provided callback
	class ScanConsumer : public clang::ASTConsumer
	{
	public:
		ScanConsumer(ParseTUHandler handler)
			: m_Handler(handler)
		{
		}

		void HandleTranslationUnit(clang::ASTContext& context) override
		{
			m_Handler(context, context.getTranslationUnitDecl());
		}

	private:
		ParseTUHandler m_Handler;
	};


	class ScanFrontendAction : public clang::ASTFrontendAction
	{
	public:
		ScanFrontendAction(ParseTUHandler handler)
			: m_Handler(handler)
		{
		}

		std::unique_ptr<clang::ASTConsumer> CreateASTConsumer(clang::CompilerInstance&, llvm::StringRef) override
		{
			return std::unique_ptr<clang::ASTConsumer>(new ScanConsumer(m_Handler));
		}

	private:
		ParseTUHandler m_Handler;
	};


	// Action factory that forwards each parsed TU to an arbitrary handler
	std::unique_ptr<clang::tooling::FrontendActionFactory> NewScanFrontendActionFactory(ParseTUHandler handler)
	{
		struct ScanFrontendActionFactory : public clang::tooling::FrontendActionFactory
		{
			std::unique_ptr<clang::FrontendAction> create() override
			{
				return std::make_unique<ScanFrontendAction>(handler);
			}
			ParseTUHandler handler;
		};

		ScanFrontendActionFactory* factory = new ScanFrontendActionFactory();
		factory->handler = handler;
		return std::unique_ptr<clang::tooling::FrontendActionFactory>(factory);
	}
}


int main(int argc, const char* argv[])
{
	float start = clock();

	LOG_TO_STDOUT(main, ALL);

	// Command-line options
	static llvm::cl::OptionCategory ToolCategoryOption("clentscan options");
	static llvm::cl::cat ToolCategory(ToolCategoryOption);
	static llvm::cl::opt<std::string> SpecLog("spec_log", llvm::cl::desc("Specify container spec log filename"),
		ToolCategory, llvm::cl::value_desc("filename"));
	static llvm::cl::opt<std::string> ASTLog("ast_log", llvm::cl::desc("Specify AST log filename"),
		ToolCategory, llvm::cl::value_desc("filename"));
	static llvm::cl::opt<std::string> Output("output", llvm::cl::desc("Specify declaration database output file"),
		ToolCategory, llvm::cl::value_desc("filename"));
	static llvm::cl::opt<bool> Timing("timing", llvm::cl::desc("Print some rough timing info"), ToolCategory);

	llvm::Expected<clang::tooling::CommonOptionsParser> options_parser =
		clang::tooling::CommonOptionsParser::create(argc, argv, ToolCategoryOption, llvm::cl::OneOrMore);
	if (!options_parser)
	{
		LOG(main, ERROR, "%s\n", llvm::toString(options_parser.takeError()).c_str());
		return 1;
	}

	// Initialize inline ASM parsing
	llvm::InitializeNativeTarget();
	llvm::InitializeNativeTargetAsmParser();

	clang::tooling::ClangTool tool(options_parser->getCompilations(), options_parser->getSourcePathList());

	// Annotations only expand under the parse define
	tool.appendArgumentsAdjuster(clang::tooling::getInsertArgumentAdjuster("-D__clent_parse__",
		clang::tooling::ArgumentInsertPosition::BEGIN));

	float prologue = clock();

	// Gather container specs for all translation units before any member types are read
	ContainerSpecs container_specs(SpecLog);
	if (tool.run(NewScanFrontendActionFactory([&container_specs](clang::ASTContext&, clang::TranslationUnitDecl* tu_decl) {
			container_specs.Gather(tu_decl);
		}).get()) != 0)
	{
		return 1;
	}

	float specs = clock();

	// On the second pass, build the declaration database
	clent::DeclDatabase db;
	ASTConsumer ast_consumer(db, container_specs, ASTLog);
	if (tool.run(NewScanFrontendActionFactory([&ast_consumer](clang::ASTContext& context, clang::TranslationUnitDecl* tu_decl) {
			ast_consumer.WalkTranslationUnit(&context, tu_decl);
		}).get()) != 0)
	{
		return 1;
	}

	float build = clock();

	if (Output != "")
	{
		if (!clent::WriteDeclDatabase(Output.c_str(), db))
		{
			LOG(main, ERROR, "Couldn't write declaration database '%s'\n", Output.c_str());
			return 1;
		}
		LOG(main, INFO, "Wrote %d types to %s\n", (int)db.GetNbTypes(), Output.c_str());
	}

	float end = clock();

	// Print some rough profiling info
	if (Timing)
	{
		printf("Prologue:   %.3f\n", (prologue - start) / CLOCKS_PER_SEC);
		printf("Specs:      %.3f\n", (specs - prologue) / CLOCKS_PER_SEC);
		printf("Building:   %.3f\n", (build - specs) / CLOCKS_PER_SEC);
		printf("Database:   %.3f\n", (end - build) / CLOCKS_PER_SEC);
		printf("Total time: %.3f\n", (end - start) / CLOCKS_PER_SEC);
	}

	return 0;
}
